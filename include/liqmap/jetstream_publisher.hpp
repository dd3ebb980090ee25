#pragma once

#include "liqmap/publisher.hpp"

#include <chrono>
#include <mutex>
#include <string>

#include <nats.h>

namespace liqmap {

struct JetStreamConfig {
  std::string url;
  std::string stream;
  std::string subject_root;
  std::chrono::milliseconds publish_timeout{500};
};

/// JetStream publisher that serializes events to protobuf and writes to NATS.
///
/// Subjects: <root>.gap.<tf>.<symbol> and <root>.zones.<tf>.<symbol>.
/// Each message carries a Nats-Msg-Id so redeliveries are deduplicated.
class JetStreamPublisher : public EventPublisher {
public:
  /// @throws std::runtime_error when the connection cannot be established
  explicit JetStreamPublisher(const JetStreamConfig &config);
  ~JetStreamPublisher() override;

  JetStreamPublisher(const JetStreamPublisher &) = delete;
  JetStreamPublisher &operator=(const JetStreamPublisher &) = delete;

  void publish_gap(const GapEvent &event) override;
  void publish_zones(const ZoneSnapshot &snapshot) override;

private:
  std::string build_subject(const std::string &kind, const std::string &symbol,
                            Timeframe timeframe) const;
  std::string sanitize_token(const std::string &token) const;
  void publish_payload(const std::string &subject, const std::string &msg_id,
                       const std::string &payload);

  JetStreamConfig config_;
  natsConnection *conn_{nullptr};
  jsCtx *js_{nullptr};
  mutable std::mutex mutex_;
};

} // namespace liqmap
