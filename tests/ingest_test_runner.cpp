#include "broadcast_hub.hpp"
#include "http_test_client.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"
#include "transfer_registry.hpp"
#include "upload_ingest.hpp"

#include <asio.hpp>

#include <algorithm>
#include <chrono>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using qrdrop::test::TestCase;
using qrdrop::test::TestContext;
using qrdrop::test::check;
using qrdrop::test::make_upload_body;
using namespace std::chrono_literals;

namespace {

const std::string kBoundary = "----WebKitFormBoundaryqrdropIngest";

std::string part(const std::string& disposition, const std::string& content) {
  return "--" + kBoundary + "\r\nContent-Disposition: " + disposition + "\r\n\r\n" + content + "\r\n";
}

std::string closing() {
  return "--" + kBoundary + "--\r\n";
}

std::string pattern_bytes(std::size_t n) {
  std::string out(n, '\0');
  for(std::size_t i = 0; i < n; ++i) out[i] = static_cast<char>((i * 31 + 7) % 251);
  return out;
}

void feed_in_chunks(UploadIngest& ingest, const std::string& body, std::size_t chunk) {
  for(std::size_t pos = 0; pos < body.size(); pos += chunk) {
    ingest.feed(body.data() + pos, std::min(chunk, body.size() - pos));
  }
}

// Feeds `body` and finishes; returns the kind of the IngestError raised.
std::optional<IngestError::Kind> ingest_error(const std::string& body,
                                              IngestOptions options = IngestOptions{},
                                              std::shared_ptr<TransferRegistry> registry = nullptr,
                                              std::uint64_t* received = nullptr) {
  UploadIngest ingest(kBoundary, std::move(registry), nullptr, options);
  try {
    feed_in_chunks(ingest, body, 16);
    ingest.finish();
  } catch(const IngestError& e) {
    if(received) *received = ingest.bytes_received();
    return e.kind();
  }
  return std::nullopt;
}

bool expect_kind(TestContext& ctx,
                 const std::optional<IngestError::Kind>& got,
                 IngestError::Kind expected,
                 const std::string& what) {
  return check(ctx, got == expected,
               what + ": expected " + to_string(expected) + ", got " + (got ? to_string(*got) : "success"));
}

bool test_round_trip_with_progress(TestContext& ctx) {
  auto registry = std::make_shared<TransferRegistry>();
  auto rx = registry->register_transfer("holiday photo.jpg", DeviceClass::Desktop);
  std::vector<int> seen;
  rx.set_listener([&]{
    if(auto v = rx.try_recv()) seen.push_back(*v);
  });

  const std::string content = pattern_bytes(20000);
  const std::string body = make_upload_body(kBoundary, std::to_string(content.size()), "holiday photo.jpg", content);
  UploadIngest ingest(kBoundary, registry, nullptr, IngestOptions{});
  feed_in_chunks(ingest, body, 333);
  auto file = ingest.finish();

  bool ok = true;
  ok &= check(ctx, file.name == "holiday photo.jpg" && file.display_name == "holiday photo.jpg", "names");
  ok &= check(ctx, file.size == content.size(), "size");
  ok &= check(ctx, std::string(file.bytes.begin(), file.bytes.end()) == content, "bytes intact");
  ok &= check(ctx, !seen.empty() && seen.back() == 100, "progress ends at 100");
  ok &= check(ctx, std::all_of(seen.begin(), seen.end(), [](int v){ return v % 5 == 0; }),
              "only 5% steps reported");
  ok &= check(ctx, std::adjacent_find(seen.begin(), seen.end(), std::greater_equal<int>()) == seen.end(),
              "progress strictly increasing");
  auto record = registry->lookup("holiday photo.jpg");
  ok &= check(ctx, record && record->progress == 100 && record->size == content.size(), "registry record complete");
  return ok;
}

bool test_empty_file_reports_completion(TestContext& ctx) {
  auto registry = std::make_shared<TransferRegistry>();
  auto rx = registry->register_transfer("empty.txt", DeviceClass::Mobile);
  rx.try_recv();
  UploadIngest ingest(kBoundary, registry, nullptr, IngestOptions{});
  const std::string body = make_upload_body(kBoundary, "0", "empty.txt", "");
  feed_in_chunks(ingest, body, body.size());
  auto file = ingest.finish();
  bool ok = true;
  ok &= check(ctx, file.size == 0 && file.bytes.empty(), "empty file accepted");
  ok &= check(ctx, rx.try_recv() == 100, "empty file reaches 100");
  return ok;
}

bool test_size_limit_before_file_bytes(TestContext& ctx) {
  IngestOptions options;
  options.size_limit = 1000;
  std::uint64_t received = 99;
  const std::string body = make_upload_body(kBoundary, "1001", "big.bin", pattern_bytes(1001));
  auto kind = ingest_error(body, options, nullptr, &received);
  bool ok = expect_kind(ctx, kind, IngestError::Kind::SizeLimitExceeded, "declared size over the limit");
  ok &= check(ctx, received == 0, "rejected before any file byte was accepted");
  ok &= check(ctx, IngestError(IngestError::Kind::SizeLimitExceeded, "x").category() ==
                   IngestError::Category::ResourceExhaustion, "resource exhaustion category");
  ok &= check(ctx, !ingest_error(make_upload_body(kBoundary, "1000", "ok.bin", pattern_bytes(1000)), options),
              "exactly the limit is accepted");
  return ok;
}

bool test_invalid_size_field(TestContext& ctx) {
  bool ok = true;
  for(const std::string& bad : {std::string("12abc"), std::string(""), std::string("-5"), std::string(" 12"),
                                std::string(40, '9'), std::string("99999999999999999999")}) {
    const std::string body = make_upload_body(kBoundary, bad, "a.txt", "12");
    ok &= expect_kind(ctx, ingest_error(body), IngestError::Kind::InvalidSize, "size '" + bad + "'");
  }
  return ok;
}

bool test_allocation_failure(TestContext& ctx) {
  IngestOptions options;
  options.size_limit = std::numeric_limits<std::uint64_t>::max();
  const std::string body = make_upload_body(kBoundary, "18446744073709551615", "huge.bin", "x");
  return expect_kind(ctx, ingest_error(body, options), IngestError::Kind::AllocationFailure,
                     "unsatisfiable reservation");
}

bool test_part_order_and_shape(TestContext& ctx) {
  bool ok = true;
  ok &= expect_kind(ctx, ingest_error(
      part("form-data; name=\"file\"; filename=\"a.txt\"", "abc") +
      part("form-data; name=\"size\"", "3") + closing()),
    IngestError::Kind::OrderingError, "file before size");
  ok &= expect_kind(ctx, ingest_error(
      part("form-data; name=\"size\"", "3") +
      part("form-data; name=\"file\"", "abc") + closing()),
    IngestError::Kind::MissingFilename, "file without filename");
  ok &= expect_kind(ctx, ingest_error(
      part("form-data; name=\"size\"", "3") +
      part("form-data; name=\"file\"; filename=\"\"", "abc") + closing()),
    IngestError::Kind::MissingFilename, "empty filename");
  ok &= expect_kind(ctx, ingest_error(
      part("form-data; name=\"comment\"", "hi") +
      part("form-data; name=\"size\"", "3") + closing()),
    IngestError::Kind::UnexpectedPart, "unknown field");
  ok &= expect_kind(ctx, ingest_error(
      part("form-data; name=\"size\"", "3") +
      part("form-data; name=\"size\"", "3") + closing()),
    IngestError::Kind::UnexpectedPart, "duplicate size");
  ok &= expect_kind(ctx, ingest_error(
      part("form-data; name=\"size\"", "3") +
      part("form-data; name=\"file\"; filename=\"a.txt\"", "abc") +
      part("form-data; name=\"extra\"", "x") + closing()),
    IngestError::Kind::UnexpectedPart, "third field");
  ok &= expect_kind(ctx, ingest_error(part("form-data; name=\"size\"", "3") + closing()),
    IngestError::Kind::MissingFile, "no file field");
  ok &= expect_kind(ctx, ingest_error(closing()), IngestError::Kind::MissingSize, "no fields at all");
  return ok;
}

bool test_size_mismatch(TestContext& ctx) {
  bool ok = true;
  std::uint64_t received = 0;
  ok &= expect_kind(ctx, ingest_error(make_upload_body(kBoundary, "5", "a.txt", "0123456789"), IngestOptions{},
                                      nullptr, &received),
                    IngestError::Kind::SizeMismatch, "more bytes than declared");
  ok &= check(ctx, received <= 5, "never buffers past the declared size");
  ok &= expect_kind(ctx, ingest_error(make_upload_body(kBoundary, "10", "a.txt", "01234")),
                    IngestError::Kind::SizeMismatch, "fewer bytes than declared");
  return ok;
}

bool test_malformed_body(TestContext& ctx) {
  bool ok = true;
  ok &= expect_kind(ctx, ingest_error("--" + kBoundary + "garbage\r\n"), IngestError::Kind::MalformedBody,
                    "garbage after the boundary");
  ok &= expect_kind(ctx, ingest_error(part("form-data; name=\"size\"", "3") +
                                      "--" + kBoundary + "\r\nContent-Disposition: form-data; name=\"file\"; "
                                      "filename=\"a.txt\"\r\n\r\nab"),
                    IngestError::Kind::MalformedBody, "truncated body");
  ok &= expect_kind(ctx, ingest_error("--" + kBoundary + "\r\nContent-Type: text/plain\r\n\r\nx\r\n" + closing()),
                    IngestError::Kind::MalformedBody, "part without disposition");

  bool threw = false;
  try {
    UploadIngest ingest("", nullptr, nullptr, IngestOptions{});
  } catch(const IngestError& e) {
    threw = e.kind() == IngestError::Kind::MalformedBody && e.http_status() == 400;
  }
  ok &= check(ctx, threw, "empty boundary rejected");
  return ok;
}

bool test_missing_registry_policy(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("ingest-test");
  ctx.logs.attach(logger);
  auto registry = std::make_shared<TransferRegistry>();
  const std::string content = pattern_bytes(5000);
  const std::string body = make_upload_body(kBoundary, std::to_string(content.size()), "untracked.bin", content);

  bool ok = true;
  {
    IngestOptions strict;
    strict.missing_policy = MissingTransferPolicy::Strict;
    UploadIngest ingest(kBoundary, registry, nullptr, strict, logger);
    std::optional<IngestError::Kind> kind;
    try {
      feed_in_chunks(ingest, body, 512);
      ingest.finish();
    } catch(const IngestError& e) {
      kind = e.kind();
      ok &= check(ctx, e.category() == IngestError::Category::MissingRegistryEntry, "strict category");
    }
    ok &= expect_kind(ctx, kind, IngestError::Kind::MissingRegistryEntry, "strict policy");
    ok &= check(ctx, ingest.bytes_received() == 0, "strict rejects before accepting bytes");
  }
  {
    UploadIngest ingest(kBoundary, registry, nullptr, IngestOptions{}, logger);
    feed_in_chunks(ingest, body, 512);
    auto file = ingest.finish();
    ok &= check(ctx, file.size == content.size(), "lenient policy keeps going");
    ok &= check(ctx, ctx.logs.count_substring("nobody is tracking this transfer") == 1, "warned once");
    ok &= check(ctx, ctx.logs.count_substring("no progress record") == 0, "no warning per chunk");
    ok &= check(ctx, registry->size() == 0, "nothing registered implicitly");
  }
  {
    MissingTransferPolicy policy = MissingTransferPolicy::Lenient;
    ok &= check(ctx, parse_missing_transfer_policy("strict", policy) && policy == MissingTransferPolicy::Strict,
                "parse strict");
    ok &= check(ctx, !parse_missing_transfer_policy("sometimes", policy), "reject unknown policy");
  }
  return ok;
}

bool test_progress_wakes_complementary_stream(TestContext& ctx) {
  asio::io_context io;
  auto work = asio::make_work_guard(io);
  auto registry = std::make_shared<TransferRegistry>();
  BroadcastHub::Options options;
  options.active_interval = 10ms;
  options.idle_interval = 15ms;
  auto hub = std::make_shared<BroadcastHub>(io, options);
  for(auto cls : {BroadcastClass::Mobile, BroadcastClass::Desktop}) {
    hub->set_source(cls, [registry, cls]{
      return make_transfer_list(registry->snapshot(*reported_device(cls))).dump();
    });
  }
  std::thread runner([&]{ io.run(); });

  auto phone_view = hub->subscribe(BroadcastClass::Mobile);
  auto desktop_view = hub->subscribe(BroadcastClass::Desktop);
  auto progress = registry->register_transfer("desk.iso", DeviceClass::Desktop);

  const std::string content = pattern_bytes(4000);
  const std::string body = make_upload_body(kBoundary, std::to_string(content.size()), "desk.iso", content);
  UploadIngest ingest(kBoundary, registry, hub, IngestOptions{});
  feed_in_chunks(ingest, body, 100);
  ingest.finish();

  const std::string expected = R"([{"name":"desk.iso","progress":100,"size":4000}])";
  bool phone_saw = false;
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while(!phone_saw && std::chrono::steady_clock::now() < deadline) {
    auto value = phone_view.recv_for(20ms);
    phone_saw = value && *value == expected;
  }
  bool desktop_clean = true;
  while(auto value = desktop_view.try_recv()) {
    if(value->find("desk.iso") != std::string::npos) desktop_clean = false;
  }

  hub->shutdown();
  work.reset();
  io.stop();
  runner.join();

  bool ok = true;
  ok &= check(ctx, phone_saw, "phone stream shows the finished desktop upload");
  ok &= check(ctx, desktop_clean, "desktop stream never lists its own upload");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"round_trip_with_progress", test_round_trip_with_progress},
    {"empty_file_reports_completion", test_empty_file_reports_completion},
    {"size_limit_before_file_bytes", test_size_limit_before_file_bytes},
    {"invalid_size_field", test_invalid_size_field},
    {"allocation_failure", test_allocation_failure},
    {"part_order_and_shape", test_part_order_and_shape},
    {"size_mismatch", test_size_mismatch},
    {"malformed_body", test_malformed_body},
    {"missing_registry_policy", test_missing_registry_policy},
    {"progress_wakes_complementary_stream", test_progress_wakes_complementary_stream},
  };
  return qrdrop::test::run_suite("ingest", tests, argc, argv);
}
