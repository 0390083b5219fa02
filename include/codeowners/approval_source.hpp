#pragma once

#include "codeowners/types.hpp"
#include <string>
#include <utility>
#include <vector>

namespace codeowners {

/// Supplies the logins that approved the change under review.
class ApprovalSource {
public:
    virtual ~ApprovalSource() = default;

    virtual ApproverSet approvers() const = 0;
};

/// Approvals known up front (command line, approvals file, tests).
class StaticApprovalSource : public ApprovalSource {
public:
    explicit StaticApprovalSource(std::vector<std::string> logins) : logins_(std::move(logins)) {}

    ApproverSet approvers() const override {
        ApproverSet set;
        for (const auto& login : logins_) set.add(login);
        return set;
    }

private:
    std::vector<std::string> logins_;
};

} // namespace codeowners
