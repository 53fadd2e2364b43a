#include "ApprovalGate.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

namespace {

std::string trim_and_lower(std::string value)
{
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

} // namespace


ApprovalGate::ApprovalGate(const RunContext& context, std::istream& in, std::ostream& out)
    : context_(context),
      in_(in),
      out_(out)
{
}


bool ApprovalGate::read_response(std::string& response)
{
    out_.flush();
    if (!std::getline(in_, response)) {
        out_ << "\n";
        return false;
    }
    if (!response.empty() && response.back() == '\r') {
        response.pop_back();
    }
    return true;
}


Approval ApprovalGate::confirm(const std::string& title, const std::string& description)
{
    auto logger = Logger::get_logger("core_logger");

    out_ << "\n"
         << "+-------------------------------------------------+\n"
         << "|  APPROVAL REQUIRED: " << title << "\n"
         << "+-------------------------------------------------+\n"
         << "  " << description << "\n\n";

    if (context_.dry_run()) {
        if (logger) {
            logger->info("[DRY-RUN] Would proceed with: {}", title);
        }
        return Approval::Approved;
    }

    out_ << "  Proceed with " << title << "? [yes/no] > ";
    std::string response;
    const bool answered = read_response(response);
    const std::string normalized = trim_and_lower(response);

    if (answered && (normalized == "yes" || normalized == "y")) {
        if (logger) {
            logger->info("Approved: {}", title);
        }
        return Approval::Approved;
    }

    if (logger) {
        logger->warn("Declined: {}", title);
    }
    return Approval::Declined;
}


Approval ApprovalGate::confirm_phrase(const std::string& prompt, const std::string& phrase)
{
    auto logger = Logger::get_logger("core_logger");

    if (context_.dry_run()) {
        if (logger) {
            logger->info("[DRY-RUN] Would ask to type '{}': {}", phrase, prompt);
        }
        return Approval::Approved;
    }

    out_ << "  " << prompt << "\n"
         << "  Type '" << phrase << "' to confirm > ";
    std::string response;
    if (read_response(response) && response == phrase) {
        if (logger) {
            logger->info("Confirmation phrase accepted");
        }
        return Approval::Approved;
    }

    if (logger) {
        logger->warn("Confirmation text did not match");
    }
    return Approval::Declined;
}
