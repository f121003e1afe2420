#ifndef SETI_CORE_ANALYSIS_PROGRESS_H
#define SETI_CORE_ANALYSIS_PROGRESS_H

#if defined(SETI_GUI_BUILD)
#error "GUI code cannot include core/analysis/analysis_progress.h. Use AnalysisPresenter instead."
#endif

#include <string>

namespace seti {

/**
 * @brief Abstract interface for progress reporting during analysis
 */
class AnalysisProgress {
public:
    virtual ~AnalysisProgress() = default;

    /**
     * @brief Announce the start of a named stage
     */
    virtual void setStage(const std::string& stage) = 0;

    /**
     * @brief Report progress percentage (0-100)
     */
    virtual void setProgress(int percentage) = 0;

    /**
     * @brief Check if user requested cancellation
     */
    virtual bool isCancelled() const = 0;
};

/**
 * @brief Null progress implementation (does nothing)
 */
class NullProgress : public AnalysisProgress {
public:
    void setStage(const std::string&) override {}
    void setProgress(int) override {}
    bool isCancelled() const override { return false; }
};

} // namespace seti

#endif // SETI_CORE_ANALYSIS_PROGRESS_H
