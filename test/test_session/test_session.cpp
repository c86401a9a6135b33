/*
 * test_session.cpp -- Unity tests for the device session and retry loop.
 *
 * Uses the in-memory bus and a manual clock, so settle delays cost nothing.
 * Run with: ctest -R test_session
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <unity.h>

#include "infrastructure/clock/ManualClock.h"
#include "infrastructure/transport/InMemoryTransport.h"
#include "layers/application/Device.h"
#include "layers/application/application_layer.h"
#include "layers/protocol/protocol_layer.h"

using application::CommandKind;
using application::ErrorKind;
using application::RetryState;

static const uint8_t ADDR = 3;

static application::ManualClock *clock_;
static transport::InMemoryTransport *bus;
static application::DeviceSession *session;
static application::Device device;

/* -- DeviceSession tests -------------------------------------------------- */

void
test_query_success_counts_both_directions (void)
{
  bus->scriptReply (ADDR, protocol::kAck, "23.5");

  const auto result = session->query (*bus, device, "MEA CH 1 ?");
  TEST_ASSERT_TRUE (result.success);
  TEST_ASSERT_EQUAL_HEX8 (protocol::kAck, result.status);
  TEST_ASSERT_EQUAL_STRING ("23.5", result.payload.c_str ());
  TEST_ASSERT_EQUAL_UINT (1, device.counters.sent);
  TEST_ASSERT_EQUAL_UINT (1, device.counters.received);
  TEST_ASSERT_EQUAL_UINT (0, device.counters.nak);
}

void
test_query_waits_settle_interval (void)
{
  bus->scriptReply (ADDR, protocol::kAck, "1");
  session->query (*bus, device, "SN ?");
  TEST_ASSERT_EQUAL (1, clock_->sleeps ().size ());
  TEST_ASSERT_EQUAL (485, clock_->sleeps ().front ().count ());
}

void
test_query_sends_encoded_request (void)
{
  bus->scriptReply (ADDR, protocol::kAck, "1");
  session->query (*bus, device, "SN ?");
  const auto frames = bus->sentFrames ();
  TEST_ASSERT_EQUAL (1, frames.size ());
  const auto expected = protocol::encodeRequest ("SN ?", ADDR);
  TEST_ASSERT_TRUE (expected == frames.front ());
}

void
test_query_timeout (void)
{
  const auto result = session->query (*bus, device, "SN ?");
  TEST_ASSERT_FALSE (result.success);
  TEST_ASSERT_TRUE (result.error == ErrorKind::Timeout);
  TEST_ASSERT_EQUAL_UINT (1, device.counters.sent);
  TEST_ASSERT_EQUAL_UINT (0, device.counters.received);
}

void
test_query_checksum_mismatch (void)
{
  auto raw = protocol::encodeResponse (protocol::kAck, "SN001");
  raw[2] ^= 0x10;
  bus->scriptRawReply (ADDR, raw);

  const auto result = session->query (*bus, device, "SN ?");
  TEST_ASSERT_FALSE (result.success);
  TEST_ASSERT_TRUE (result.error == ErrorKind::ChecksumMismatch);
  TEST_ASSERT_EQUAL_UINT (1, device.counters.sent);
  TEST_ASSERT_EQUAL_UINT (0, device.counters.received);
}

void
test_query_send_failure_not_counted (void)
{
  bus->failSends (true);
  const auto result = session->query (*bus, device, "SN ?");
  TEST_ASSERT_TRUE (result.error == ErrorKind::TransportError);
  TEST_ASSERT_EQUAL_UINT (0, device.counters.sent);
  TEST_ASSERT_EQUAL (0, clock_->sleeps ().size ());
}

void
test_query_encoding_overflow (void)
{
  const std::string huge (protocol::kTransmitCapacity, 'A');
  const auto result = session->query (*bus, device, huge);
  TEST_ASSERT_TRUE (result.error == ErrorKind::EncodingOverflow);
  TEST_ASSERT_EQUAL (0, bus->sentFrames ().size ());
  TEST_ASSERT_EQUAL_UINT (0, device.counters.sent);
}

void
test_flush_drops_stale_bytes (void)
{
  /* A byte left over from an aborted exchange must not be taken as the
     reply to the next request. */
  bus->injectLineNoise ({0x06, 0x06});
  session->flush (*bus);
  TEST_ASSERT_EQUAL (1, bus->receiveCalls ());
  TEST_ASSERT_EQUAL (0, bus->sentFrames ().size ());

  bus->scriptReply (ADDR, protocol::kAck, "SN001");
  const auto result = session->query (*bus, device, "SN ?");
  TEST_ASSERT_TRUE (result.success);
  TEST_ASSERT_EQUAL_STRING ("SN001", result.payload.c_str ());
}

void
test_flush_on_quiet_line (void)
{
  session->flush (*bus);
  TEST_ASSERT_EQUAL (1, bus->receiveCalls ());
  TEST_ASSERT_EQUAL_UINT (0, device.counters.sent);
  TEST_ASSERT_EQUAL_UINT (0, device.counters.received);
}

/* -- RetryController tests ------------------------------------------------ */

void
test_retry_nak_then_ack (void)
{
  /* N-1 NAKs followed by an ACK succeed on attempt N. */
  const unsigned n = 5;
  for (unsigned i = 0; i + 1 < n; i++)
    bus->scriptReply (ADDR, protocol::kNak, "");
  bus->scriptReply (ADDR, protocol::kAck, "23.5");

  application::RetryController retry (*session, *clock_, 25);
  const auto outcome = retry.run (*bus, device, CommandKind::Measurement);
  TEST_ASSERT_TRUE (outcome.state == RetryState::Succeeded);
  TEST_ASSERT_EQUAL (n, outcome.attempts);
  TEST_ASSERT_EQUAL_UINT (n - 1, device.counters.nak);
  TEST_ASSERT_EQUAL_UINT (n, device.counters.sent);
  TEST_ASSERT_EQUAL_STRING ("23.5", device.value.c_str ());
  TEST_ASSERT_TRUE (device.timestamp == clock_->now ());
}

void
test_retry_exhausted_by_naks_keeps_reading (void)
{
  const auto before = application::TimePoint (std::chrono::seconds (1000));
  device.value = "19.0";
  device.timestamp = before;
  bus->scriptReply (ADDR, protocol::kNak, "");
  bus->scriptReply (ADDR, protocol::kNak, "");
  bus->scriptReply (ADDR, protocol::kNak, "");
  bus->scriptReply (ADDR, protocol::kNak, "");

  application::RetryController retry (*session, *clock_, 4);
  const auto outcome = retry.run (*bus, device, CommandKind::Measurement);
  TEST_ASSERT_TRUE (outcome.state == RetryState::ExhaustedRetries);
  TEST_ASSERT_EQUAL (4, outcome.attempts);
  TEST_ASSERT_TRUE (outcome.last.error == ErrorKind::NegativeAcknowledge);
  TEST_ASSERT_EQUAL_UINT (4, device.counters.nak);
  TEST_ASSERT_EQUAL_STRING ("19.0", device.value.c_str ());
  TEST_ASSERT_TRUE (device.timestamp == before);
}

void
test_retry_exhausted_by_malformed_frames (void)
{
  device.serialNumber = "SN-OLD";
  for (int i = 0; i < 3; i++)
    {
      auto raw = protocol::encodeResponse (protocol::kAck, "SN002");
      raw.back () ^= 0xFF;
      bus->scriptRawReply (ADDR, raw);
    }

  application::RetryController retry (*session, *clock_, 3);
  const auto outcome = retry.run (*bus, device, CommandKind::SerialNumber);
  TEST_ASSERT_TRUE (outcome.state == RetryState::ExhaustedRetries);
  TEST_ASSERT_TRUE (outcome.last.error == ErrorKind::ChecksumMismatch);
  TEST_ASSERT_EQUAL_UINT (0, device.counters.nak);
  TEST_ASSERT_EQUAL_UINT (0, device.counters.received);
  TEST_ASSERT_EQUAL_STRING ("SN-OLD", device.serialNumber.c_str ());
}

void
test_retry_exhausted_by_timeouts (void)
{
  application::RetryController retry (*session, *clock_);
  const auto outcome = retry.run (*bus, device, CommandKind::SerialNumber);
  TEST_ASSERT_TRUE (outcome.state == RetryState::ExhaustedRetries);
  TEST_ASSERT_EQUAL (application::kDefaultMaxRetries, outcome.attempts);
  TEST_ASSERT_TRUE (outcome.last.error == ErrorKind::Timeout);
  TEST_ASSERT_EQUAL_UINT (application::kDefaultMaxRetries, device.counters.sent);
  TEST_ASSERT_EQUAL_UINT (0, device.counters.received);
}

void
test_measurement_nak_with_valid_payload_retried (void)
{
  /* Checksum-valid and well formed, but NAK: not a reading. */
  bus->scriptReply (ADDR, protocol::kNak, "23.5");
  bus->scriptReply (ADDR, protocol::kAck, "24.0");

  application::RetryController retry (*session, *clock_);
  const auto outcome = retry.run (*bus, device, CommandKind::Measurement);
  TEST_ASSERT_TRUE (outcome.succeeded ());
  TEST_ASSERT_EQUAL (2, outcome.attempts);
  TEST_ASSERT_EQUAL_STRING ("24.0", device.value.c_str ());
  TEST_ASSERT_EQUAL_UINT (1, device.counters.nak);
}

void
test_measurement_requires_ack (void)
{
  /* An address echo is a valid status but not an ACK. */
  bus->scriptReply (ADDR, 0x80 | ADDR, "23.5");
  bus->scriptReply (ADDR, 0x80 | ADDR, "23.5");

  application::RetryController retry (*session, *clock_, 2);
  const auto outcome = retry.run (*bus, device, CommandKind::Measurement);
  TEST_ASSERT_TRUE (outcome.state == RetryState::ExhaustedRetries);
  TEST_ASSERT_TRUE (outcome.last.error == ErrorKind::UnexpectedStatus);
  TEST_ASSERT_EQUAL_UINT (0, device.counters.nak);
  TEST_ASSERT_EQUAL_UINT (2, device.counters.received);
  TEST_ASSERT_TRUE (device.value.empty ());
}

void
test_serial_number_accepts_any_status (void)
{
  bus->scriptReply (ADDR, 0x80 | ADDR, "SN001");

  application::RetryController retry (*session, *clock_);
  const auto outcome = retry.run (*bus, device, CommandKind::SerialNumber);
  TEST_ASSERT_TRUE (outcome.succeeded ());
  TEST_ASSERT_EQUAL (1, outcome.attempts);
  TEST_ASSERT_EQUAL_STRING ("SN001", device.serialNumber.c_str ());
  TEST_ASSERT_FALSE (device.hasTimestamp ());
}

void
test_serial_number_nak_retried (void)
{
  bus->scriptReply (ADDR, protocol::kNak, "");
  bus->scriptReply (ADDR, protocol::kAck, "SN001");

  application::RetryController retry (*session, *clock_);
  const auto outcome = retry.run (*bus, device, CommandKind::SerialNumber);
  TEST_ASSERT_TRUE (outcome.succeeded ());
  TEST_ASSERT_EQUAL (2, outcome.attempts);
  TEST_ASSERT_EQUAL_UINT (1, device.counters.nak);
  TEST_ASSERT_EQUAL_STRING ("SN001", device.serialNumber.c_str ());
}

void
test_status_predicates (void)
{
  TEST_ASSERT_TRUE (application::acceptsStatus (CommandKind::Measurement, protocol::kAck));
  TEST_ASSERT_FALSE (application::acceptsStatus (CommandKind::Measurement, protocol::kNak));
  TEST_ASSERT_FALSE (application::acceptsStatus (CommandKind::Measurement, 0x83));
  TEST_ASSERT_TRUE (application::acceptsStatus (CommandKind::SerialNumber, protocol::kAck));
  TEST_ASSERT_TRUE (application::acceptsStatus (CommandKind::SerialNumber, 0x83));
  TEST_ASSERT_TRUE (application::acceptsStatus (CommandKind::SerialNumber, 0x00));
  TEST_ASSERT_FALSE (application::acceptsStatus (CommandKind::SerialNumber, protocol::kNak));
}

/* -- Unity setup/teardown ------------------------------------------------- */

void
setUp (void)
{
  clock_ = new application::ManualClock ();
  bus = new transport::InMemoryTransport ();
  bus->open ();
  session = new application::DeviceSession (*clock_);
  device = application::Device ();
  device.address = ADDR;
}

void
tearDown (void)
{
  delete session;
  delete bus;
  delete clock_;
  session = nullptr;
  bus = nullptr;
  clock_ = nullptr;
}

int
main (void)
{
  UNITY_BEGIN ();

  /* Device session */
  RUN_TEST (test_query_success_counts_both_directions);
  RUN_TEST (test_query_waits_settle_interval);
  RUN_TEST (test_query_sends_encoded_request);
  RUN_TEST (test_query_timeout);
  RUN_TEST (test_query_checksum_mismatch);
  RUN_TEST (test_query_send_failure_not_counted);
  RUN_TEST (test_query_encoding_overflow);
  RUN_TEST (test_flush_drops_stale_bytes);
  RUN_TEST (test_flush_on_quiet_line);

  /* Retry controller */
  RUN_TEST (test_retry_nak_then_ack);
  RUN_TEST (test_retry_exhausted_by_naks_keeps_reading);
  RUN_TEST (test_retry_exhausted_by_malformed_frames);
  RUN_TEST (test_retry_exhausted_by_timeouts);
  RUN_TEST (test_measurement_nak_with_valid_payload_retried);
  RUN_TEST (test_measurement_requires_ack);
  RUN_TEST (test_serial_number_accepts_any_status);
  RUN_TEST (test_serial_number_nak_retried);
  RUN_TEST (test_status_predicates);

  return UNITY_END ();
}
