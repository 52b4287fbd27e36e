#include "codepush/validation.hpp"

namespace codepush {

Result ValidateBaseOptions(const std::string& app_id, const std::string& token) {
    if (app_id.empty()) {
        return Result::Fail(kErrValidation, "app ID is required: set --app-id or CODEPUSH_APP_ID");
    }
    if (token.empty()) {
        return Result::Fail(kErrValidation,
                            "API token is required: set BITRISE_API_TOKEN or store a token in "
                            "the codepush config file");
    }
    return Result::Ok();
}

Result RequireDeployment(const std::string& deployment) {
    if (deployment.empty()) {
        return Result::Fail(kErrValidation,
                            "deployment is required: set --deployment or CODEPUSH_DEPLOYMENT");
    }
    return Result::Ok();
}

} // namespace codepush
