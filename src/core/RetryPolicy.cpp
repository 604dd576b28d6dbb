/* @file RetryPolicy.cpp
 * @brief provider error taxonomy -> retry/fail decision
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/RetryPolicy.hpp"
#include "core/GeoServiceClient.hpp"

namespace geoedge {
  namespace core {

    namespace {
      RetryDecision retryAfter(ErrorClass error, std::chrono::seconds delay) {
        return { RetryDecision::Action::Retry, error, delay };
      }

      RetryDecision fail(ErrorClass error) {
        return { RetryDecision::Action::Fail, error, std::chrono::seconds{ 0 } };
      }
    } // namespace

    RetryDecision classify(const ProviderReply& reply, int localHour) {
      if (!reply.body)
        return retryAfter(ErrorClass::TransientNetworkError, kTransientRetryDelay);

      if (reply.httpStatus >= 500)
        return retryAfter(ErrorClass::TransientNetworkError, kTransientRetryDelay);

      if (reply.hasProviderError()) {
        const int code = reply.providerCode.value_or(reply.httpStatus);
        if (code == 400) {
          if (reply.providerReason == "keyInvalid")
            return fail(ErrorClass::CredentialError);
          return fail(ErrorClass::BadRequest);
        }
        if (code == 403) {
          if (reply.providerReason == "userRateLimitExceeded")
            return retryAfter(ErrorClass::RateLimited, kRateLimitRetryDelay);
          if (reply.providerReason == "dailyLimitExceeded")
            return retryAfter(ErrorClass::RateLimited, secondsUntilMidnight(localHour));
        }
        if (code >= 500)
          return retryAfter(ErrorClass::TransientNetworkError, kTransientRetryDelay);
        return fail(ErrorClass::UnclassifiedProviderError);
      }

      if (reply.httpStatus >= 200 && reply.httpStatus < 300)
        return {};

      return fail(ErrorClass::UnclassifiedProviderError);
    }

  } // namespace core
} // namespace geoedge
