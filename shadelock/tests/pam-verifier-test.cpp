#include "../lock/pam-verifier.h"

#include <security/pam_appl.h>

#include <gtest/gtest.h>

using namespace shadelock;

namespace {

TEST(PamVerifierTest, RejectionsAreFailures)
{
    for (int status : {PAM_AUTH_ERR, PAM_USER_UNKNOWN, PAM_MAXTRIES, PAM_PERM_DENIED,
                       PAM_ACCT_EXPIRED, PAM_NEW_AUTHTOK_REQD})
        EXPECT_EQ(PamVerifier::classify(status), AuthResult::Failure) << "status " << status;
}

TEST(PamVerifierTest, MechanismProblemsAreErrors)
{
    for (int status : {PAM_SYSTEM_ERR, PAM_BUF_ERR, PAM_CONV_ERR, PAM_AUTHINFO_UNAVAIL,
                       PAM_ABORT, PAM_SERVICE_ERR})
        EXPECT_EQ(PamVerifier::classify(status), AuthResult::Error) << "status " << status;
}

TEST(PamVerifierTest, SuccessIsSuccess)
{
    EXPECT_EQ(PamVerifier::classify(PAM_SUCCESS), AuthResult::Success);
}

TEST(PamVerifierTest, CurrentUserResolves)
{
    EXPECT_FALSE(PamVerifier::currentUser().isEmpty());
}

TEST(NullVerifierTest, AcceptsAnything)
{
    NullVerifier verifier;
    EXPECT_EQ(verifier.verify("anything"), AuthResult::Success);
}

} // namespace
