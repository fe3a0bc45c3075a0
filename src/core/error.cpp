#include <rayshell/error.hpp>
#include <sstream>

namespace rayshell
{

ErrorReport::ErrorReport(std::string message)
{
    chain_.push_back(std::move(message));
}

ErrorReport& ErrorReport::wrap(std::string context)
{
    chain_.insert(chain_.begin(), std::move(context));
    return *this;
}

ErrorReport& ErrorReport::note(std::string text)
{
    notes_.push_back(std::move(text));
    return *this;
}

ErrorReport& ErrorReport::suggestion(std::string text)
{
    suggestions_.push_back(std::move(text));
    return *this;
}

const std::string& ErrorReport::message() const
{
    static const std::string empty_message = "(empty error report)";
    return chain_.empty() ? empty_message : chain_.front();
}

SharedReport share(ErrorReport report)
{
    return std::make_shared<const ErrorReport>(std::move(report));
}

std::string format_report(const ErrorReport& report, ErrorLogStyle style)
{
    switch (style)
    {
        case ErrorLogStyle::Short:
            return report.message();

        case ErrorLogStyle::ShortWithCause:
        {
            std::string out = report.message();
            for (size_t i = 1; i < report.chain().size(); ++i)
            {
                out += ": ";
                out += report.chain()[i];
            }
            return out;
        }

        case ErrorLogStyle::Debug:
        {
            std::ostringstream os;
            os << report.message();
            if (report.chain().size() > 1)
            {
                os << "\n\nCaused by:";
                for (size_t i = 1; i < report.chain().size(); ++i)
                    os << "\n   " << (i - 1) << ": " << report.chain()[i];
            }
            for (const auto& n : report.notes())
                os << "\n\nNote: " << n;
            for (const auto& s : report.suggestions())
                os << "\n\nSuggestion: " << s;
            return os.str();
        }
    }
    return report.message();
}

std::string to_string(ErrorLogStyle style)
{
    switch (style)
    {
        case ErrorLogStyle::Short:
            return "Short";
        case ErrorLogStyle::ShortWithCause:
            return "ShortWithCause";
        case ErrorLogStyle::Debug:
            return "Debug";
    }
    return "ShortWithCause";
}

bool error_log_style_from_string(const std::string& s, ErrorLogStyle& out)
{
    if (s == "Short")
        out = ErrorLogStyle::Short;
    else if (s == "ShortWithCause")
        out = ErrorLogStyle::ShortWithCause;
    else if (s == "Debug")
        out = ErrorLogStyle::Debug;
    else
        return false;
    return true;
}

Error::Error(ErrorReport report)
    : Error(share(std::move(report)))
{
}

Error::Error(SharedReport report)
    : std::runtime_error(format_report(*report, ErrorLogStyle::ShortWithCause)),
      report_(std::move(report))
{
}

ErrorReport report_from_exception(const std::exception& e)
{
    if (const auto* err = dynamic_cast<const Error*>(&e))
        return err->report();
    return ErrorReport(e.what());
}

}   // namespace rayshell
