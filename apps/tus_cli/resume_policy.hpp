// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TUS_CLI_RESUME_POLICY_HPP
#define TUS_CLI_RESUME_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <random>

#include <tus_error.hpp>

namespace tus {
namespace cli {

struct ResumeConfig {
  int max_attempts = 3;  // Consecutive resumes without the server offset moving
  std::chrono::milliseconds initial_delay{1000};
  std::chrono::milliseconds max_delay{30000};
  double exponential_base = 2.0;
  bool jitter = true;
  double jitter_factor = 0.5;  // Delay scaled by a factor in [1 - f, 1 + f]
};

/**
 * Decides whether an interrupted upload is resumed and how long to wait first.
 *
 * The attempt budget counts failures in a row that made no progress. Every
 * failure reached at a higher offset than the previous best starts a fresh
 * budget, so a long upload over a flaky link is not abandoned as long as
 * each attempt moves it forward.
 *
 * Not thread-safe; one policy drives one upload.
 */
class ResumePolicy {
public:
  explicit ResumePolicy(const ResumeConfig& config = {})
      : ResumePolicy(config, std::random_device{}()) {}

  ResumePolicy(const ResumeConfig& config, uint32_t seed)
      : config_(config)
      , rng_(seed) {}

  /**
   * Record a failed attempt.
   *
   * @param error Failure reported by the client
   * @param reached_offset Highest offset acknowledged by the server so far
   * @return Delay before the next attempt, or std::nullopt to give up
   */
  std::optional<std::chrono::milliseconds> onFailure(
    const client::Error& error, uint64_t reached_offset
  ) {
    if (reached_offset > best_offset_) {
      best_offset_ = reached_offset;
      stalled_attempts_ = 0;
    }
    if (!isResumable(error) || stalled_attempts_ >= config_.max_attempts) {
      return std::nullopt;
    }

    double delay_ms = static_cast<double>(backoff(config_, stalled_attempts_).count());
    if (config_.jitter) {
      std::uniform_real_distribution<double> dist(
        1.0 - config_.jitter_factor, 1.0 + config_.jitter_factor
      );
      delay_ms = std::max(delay_ms * dist(rng_), 1.0);
    }
    ++stalled_attempts_;
    return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
  }

  int stalledAttempts() const {
    return stalled_attempts_;
  }

  uint64_t bestOffset() const {
    return best_offset_;
  }

  const ResumeConfig& config() const {
    return config_;
  }

  /**
   * Delay before jitter: initial_delay * base^attempt, capped at max_delay
   */
  static std::chrono::milliseconds backoff(const ResumeConfig& config, int attempt) {
    double delay_ms = static_cast<double>(config.initial_delay.count()) *
                      std::pow(config.exponential_base, static_cast<double>(attempt));
    delay_ms = std::min(delay_ms, static_cast<double>(config.max_delay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(std::max(delay_ms, 1.0)));
  }

  /**
   * Connection failures and offset disagreements are transient; so are
   * server errors, locked resources (423) and rate limiting (429).
   * Missing resources, malformed responses and local errors are not.
   */
  static bool isResumable(const client::Error& error) {
    switch (error.code) {
      case client::ErrorCode::TRANSPORT_ERROR:
      case client::ErrorCode::OFFSET_MISMATCH:
        return true;
      case client::ErrorCode::SERVER_ERROR:
        return error.status_code >= 500 || error.status_code == 423 || error.status_code == 429;
      default:
        return false;
    }
  }

private:
  ResumeConfig config_;
  std::mt19937 rng_;
  uint64_t best_offset_ = 0;
  int stalled_attempts_ = 0;
};

}  // namespace cli
}  // namespace tus

#endif  // TUS_CLI_RESUME_POLICY_HPP
