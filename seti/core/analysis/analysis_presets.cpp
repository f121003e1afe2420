#include "analysis_presets.h"

namespace seti {

const std::vector<PresetInfo>& analysis_presets() {
    static const std::vector<PresetInfo> presets = {
        {"dbscan_fast", "DBSCAN (fast)", "Density clustering with coarse windows"},
        {"dbscan_precise", "DBSCAN (precise)", "Density clustering with fine windows"},
        {"local_search", "Local search", "Neighbourhood search around strong peaks"},
        {"spectral", "Spectral analysis", "Narrowband spectral peak search"},
    };
    return presets;
}

const PresetInfo* find_preset(const std::string& id_or_name) {
    for (const auto& preset : analysis_presets()) {
        if (preset.id == id_or_name || preset.name == id_or_name) {
            return &preset;
        }
    }
    return nullptr;
}

} // namespace seti
