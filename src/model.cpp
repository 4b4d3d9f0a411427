#include "model.hpp"

const char* model_name(Model model) {
    switch (model) {
        case Model::AUTO: return "auto";
        case Model::DMG:  return "DMG";
        case Model::MGB:  return "MGB";
        case Model::SGB:  return "SGB";
        case Model::CGB:  return "CGB";
    }
    return "unknown";
}
