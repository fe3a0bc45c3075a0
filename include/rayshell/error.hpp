#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace rayshell
{

// How reports are rendered when logged.
enum class ErrorLogStyle
{
    Short,            // outermost message only
    ShortWithCause,   // outermost message plus the cause chain on one line
    Debug,            // one line per cause, then notes and suggestions
};

// A chain of error messages, outermost context first, with optional notes and
// suggestions attached. Reports are passed between threads as SharedReport.
class ErrorReport
{
   public:
    ErrorReport() = default;
    explicit ErrorReport(std::string message);

    // Push a new outer context onto the chain.
    ErrorReport& wrap(std::string context);
    ErrorReport& note(std::string text);
    ErrorReport& suggestion(std::string text);

    const std::string&              message() const;
    const std::vector<std::string>& chain() const { return chain_; }
    const std::vector<std::string>& notes() const { return notes_; }
    const std::vector<std::string>& suggestions() const { return suggestions_; }

    bool empty() const { return chain_.empty(); }

   private:
    std::vector<std::string> chain_;
    std::vector<std::string> notes_;
    std::vector<std::string> suggestions_;
};

using SharedReport = std::shared_ptr<const ErrorReport>;

SharedReport share(ErrorReport report);

std::string format_report(const ErrorReport& report, ErrorLogStyle style);
std::string to_string(ErrorLogStyle style);
bool        error_log_style_from_string(const std::string& s, ErrorLogStyle& out);

// Exception used to propagate a report up to whoever can act on it.
class Error : public std::runtime_error
{
   public:
    explicit Error(ErrorReport report);
    explicit Error(SharedReport report);

    const ErrorReport& report() const { return *report_; }
    SharedReport       shared_report() const { return report_; }

   private:
    SharedReport report_;
};

// Build a report for an exception caught at a boundary.
ErrorReport report_from_exception(const std::exception& e);

}   // namespace rayshell
