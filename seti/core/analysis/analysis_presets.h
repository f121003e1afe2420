#ifndef SETI_CORE_ANALYSIS_PRESETS_H
#define SETI_CORE_ANALYSIS_PRESETS_H

#include "seti_analysis.h"
#include <string>
#include <vector>

namespace seti {

/**
 * @brief All analysis presets, in menu order
 */
const std::vector<PresetInfo>& analysis_presets();

/**
 * @brief Find a preset by id or by name
 * @return Pointer into the preset table, or nullptr if unknown
 */
const PresetInfo* find_preset(const std::string& id_or_name);

} // namespace seti

#endif // SETI_CORE_ANALYSIS_PRESETS_H
