#include "wojak/templates/TemplateTypes.hpp"

namespace wojak {
namespace templates {

std::string templateSourceToString(TemplateSource source) {
    switch (source) {
        case TemplateSource::ASSET:       return "asset";
        case TemplateSource::PLACEHOLDER: return "placeholder";
        default:                          return "unknown";
    }
}

const RegionDefinition* Template::region(face::RegionName name) const {
    for (const auto& def : regions) {
        if (def.name == name) {
            return &def;
        }
    }
    return nullptr;
}

} // namespace templates
} // namespace wojak
