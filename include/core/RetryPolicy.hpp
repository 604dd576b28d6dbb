#pragma once
/** @file  RetryPolicy.hpp
 *  @brief Classifies provider replies and picks proceed / retry-after / fail.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>

namespace geoedge {
  namespace core {

    struct ProviderReply;

    enum class ErrorClass : std::uint8_t {
      None,
      TransientNetworkError, ///< malformed body, 5xx, no response
      RateLimited,           ///< 403 user or daily quota
      CredentialError,       ///< 400 keyInvalid
      BadRequest,            ///< any other 400
      NoNetworksAvailable,
      UnclassifiedProviderError
    };

    inline const char* toString(ErrorClass e) {
      switch (e) {
      case ErrorClass::None:
        return "None";
      case ErrorClass::TransientNetworkError:
        return "TransientNetworkError";
      case ErrorClass::RateLimited:
        return "RateLimited";
      case ErrorClass::CredentialError:
        return "CredentialError";
      case ErrorClass::BadRequest:
        return "BadRequest";
      case ErrorClass::NoNetworksAvailable:
        return "NoNetworksAvailable";
      case ErrorClass::UnclassifiedProviderError:
        return "UnclassifiedProviderError";
      default:
        return "Unknown";
      }
    }

    inline constexpr std::chrono::seconds kTransientRetryDelay{ 60 };
    inline constexpr std::chrono::seconds kRateLimitRetryDelay{ 10 };

    /// Delay until local midnight, e.g. hour 22 -> 2 h.
    constexpr std::chrono::seconds secondsUntilMidnight(int localHour) {
      return std::chrono::seconds{ (24 - localHour) * 3600 };
    }

    struct RetryDecision {
      enum class Action { Proceed, Retry, Fail };

      Action action{ Action::Proceed };
      ErrorClass error{ ErrorClass::None };
      std::chrono::seconds delay{ 0 }; ///< only meaningful for Retry
    };

    /**
     * @brief Map one reply onto the recovery table.
     *
     * Proceed means "2xx with a JSON body and no provider error object"; whether
     * that body is usable for the stage is the caller's call.
     */
    RetryDecision classify(const ProviderReply& reply, int localHour);

  } // namespace core
} // namespace geoedge
