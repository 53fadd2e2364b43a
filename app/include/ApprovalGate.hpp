#ifndef APPROVAL_GATE_HPP
#define APPROVAL_GATE_HPP

#include "RunContext.hpp"

#include <iosfwd>
#include <string>

enum class Approval {
    Approved,
    Declined
};

/**
 * @brief Blocking human confirmation checkpoint.
 *
 * Waits indefinitely for a line of input; end of input counts as a decline.
 * Under dry-run every prompt short-circuits to Approved without reading.
 */
class ApprovalGate {
public:
    ApprovalGate(const RunContext& context, std::istream& in, std::ostream& out);

    // `yes` or `y`, in any letter case, approves.
    Approval confirm(const std::string& title, const std::string& description);

    // Approves only when the typed line equals `phrase` exactly.
    Approval confirm_phrase(const std::string& prompt, const std::string& phrase);

private:
    bool read_response(std::string& response);

    const RunContext& context_;
    std::istream& in_;
    std::ostream& out_;
};

#endif
