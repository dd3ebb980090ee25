#include "liqmap/jetstream_publisher.hpp"

#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace liqmap {

namespace {

std::string natsErrorMessage(natsStatus status) {
  const char *text = natsStatus_GetText(status);
  return text != nullptr ? std::string{text} : std::string{"unknown"};
}

} // namespace

JetStreamPublisher::JetStreamPublisher(const JetStreamConfig &config)
    : config_(config) {
  natsOptions *opts = nullptr;
  natsStatus status = natsOptions_Create(&opts);
  if (status != NATS_OK) {
    throw std::runtime_error("natsOptions_Create failed: " +
                             natsErrorMessage(status));
  }

  if (config_.url.empty()) {
    config_.url = "nats://127.0.0.1:4222";
  }
  if (config_.subject_root.empty()) {
    config_.subject_root = "liqmap";
  }

  status = natsOptions_SetURL(opts, config_.url.c_str());
  if (status != NATS_OK) {
    natsOptions_Destroy(opts);
    throw std::runtime_error("natsOptions_SetURL failed: " +
                             natsErrorMessage(status));
  }

  status = natsConnection_Connect(&conn_, opts);
  natsOptions_Destroy(opts);
  if (status != NATS_OK) {
    throw std::runtime_error("natsConnection_Connect failed: " +
                             natsErrorMessage(status));
  }

  status = natsConnection_JetStream(&js_, conn_, nullptr);
  if (status != NATS_OK) {
    natsConnection_Destroy(conn_);
    conn_ = nullptr;
    throw std::runtime_error("natsConnection_JetStream failed: " +
                             natsErrorMessage(status));
  }
}

JetStreamPublisher::~JetStreamPublisher() {
  if (js_ != nullptr) {
    jsCtx_Destroy(js_);
    js_ = nullptr;
  }
  if (conn_ != nullptr) {
    natsConnection_Close(conn_);
    natsConnection_Destroy(conn_);
    conn_ = nullptr;
  }
}

std::string JetStreamPublisher::sanitize_token(const std::string &token) const {
  std::string sanitized;
  sanitized.reserve(token.size());
  for (char c : token) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-') {
      sanitized.push_back(c);
    } else {
      sanitized.push_back('_');
    }
  }
  return sanitized;
}

std::string JetStreamPublisher::build_subject(const std::string &kind,
                                              const std::string &symbol,
                                              Timeframe timeframe) const {
  std::ostringstream subject;
  subject << config_.subject_root << '.' << kind << '.'
          << timeframe_label(timeframe) << '.' << sanitize_token(symbol);
  return subject.str();
}

void JetStreamPublisher::publish_gap(const GapEvent &event) {
  const std::string subject = build_subject("gap", event.symbol, event.timeframe);
  const std::string msg_id =
      subject + ":" + std::to_string(event.range.first_open_ts) + "-" +
      std::to_string(event.range.last_open_ts);
  publish_payload(subject, msg_id, encode_gap_event(event));
}

void JetStreamPublisher::publish_zones(const ZoneSnapshot &snapshot) {
  const std::string subject =
      build_subject("zones", snapshot.symbol, snapshot.timeframe);
  const std::string msg_id = subject + ":" + std::to_string(snapshot.as_of_ts);
  publish_payload(subject, msg_id, encode_zone_snapshot(snapshot));
}

void JetStreamPublisher::publish_payload(const std::string &subject,
                                         const std::string &msg_id,
                                         const std::string &payload) {
  if (js_ == nullptr) {
    throw std::runtime_error("JetStream context not initialized");
  }
  if (payload.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("payload too large for js_Publish");
  }

  jsPubAck *ack = nullptr;
  jsErrCode err_code = static_cast<jsErrCode>(0);

  jsPubOptions opts;
  jsPubOptions_Init(&opts);
  if (!config_.stream.empty()) {
    opts.ExpectStream = config_.stream.c_str();
  }
  opts.MsgId = msg_id.c_str();
  if (config_.publish_timeout.count() > 0) {
    opts.MaxWait = config_.publish_timeout.count();
  }

  natsStatus status;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    status = js_Publish(&ack, js_, subject.c_str(), payload.data(),
                        static_cast<int>(payload.size()), &opts, &err_code);
  }

  if (ack != nullptr) {
    jsPubAck_Destroy(ack);
  }

  if (status != NATS_OK) {
    throw std::runtime_error("js_Publish failed: " + natsErrorMessage(status) +
                             ", jsErrCode=" + std::to_string(err_code));
  }
}

} // namespace liqmap
