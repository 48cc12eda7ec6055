#include "test_framework.hpp"

#include "cdpgate/common/blocking.hpp"
#include "cdpgate/common/event_loop.hpp"
#include "cdpgate/common/fs.hpp"
#include "cdpgate/common/json_util.hpp"
#include "cdpgate/common/result.hpp"
#include "cdpgate/common/toml.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

void register_common_tests(std::vector<cdpgate::tests::TestCase> &tests) {
  using cdpgate::tests::require;
  namespace common = cdpgate::common;

  tests.push_back({"json_parse_object_keeps_raw_values", [] {
                     const auto map = common::json_parse_object(
                         R"({"a":"x","b":12,"c":{"d":[1,2]},"e":null,"f":true})");
                     require(map.at("a") == "\"x\"", "strings keep quotes");
                     require(map.at("b") == "12", "numbers stay raw");
                     require(map.at("c") == R"({"d":[1,2]})", "nested objects stay raw");
                     require(common::json_is_null(map.at("e")), "null stays null");
                     require(common::json_bool_field(map, "f") == true, "bool decodes");
                     require(!common::json_string_field(map, "b").has_value(),
                             "number is not a string");
                   }});

  tests.push_back({"json_unescape_handles_surrogate_pairs", [] {
                     require(common::json_unescape("\\ud83d\\ude00") == "\xF0\x9F\x98\x80",
                             "surrogate pair should decode to one code point");
                     require(common::json_unescape("a\\nb\\\"c") == "a\nb\"c",
                             "short escapes decode");
                   }});

  tests.push_back({"json_object_writes_null_for_empty_raw", [] {
                     require(common::json_object({{"a", ""}, {"b", "1"}}) == R"({"a":null,"b":1})",
                             "empty raw value should be null");
                     require(common::json_array({}) == "[]", "empty array");
                     require(common::json_quote("say \"hi\"") == R"("say \"hi\"")",
                             "quote escapes");
                   }});

  tests.push_back({"json_split_array_respects_nesting", [] {
                     const auto items = common::json_split_array(R"([1,"a,b",{"x":[2,3]}])");
                     require(items.size() == 3, "three top-level items");
                     require(items[1] == "\"a,b\"", "comma inside string is not a separator");
                     require(items[2] == R"({"x":[2,3]})", "object kept whole");
                     require(common::json_string_array(R"(["a",1,"b"])").size() == 2,
                             "non-strings skipped");
                   }});

  tests.push_back({"toml_reads_sections_and_types", [] {
                     const auto doc = common::parse_toml(
                         "# comment\n[browser]\ndevtools_port = 9333\n"
                         "devtools_host = \"10.0.0.2\"\n[sessions]\nauto_create = true\n");
                     require(doc.ok(), doc.ok() ? "" : doc.error());
                     require(doc.value().get_u16("browser.devtools_port", 0) == 9333, "port");
                     require(doc.value().get_string("browser.devtools_host") == "10.0.0.2",
                             "host");
                     require(doc.value().get_bool("sessions.auto_create", false), "bool");
                     require(doc.value().get_u64("missing.key", 7) == 7, "fallback");
                   }});

  tests.push_back({"event_loop_runs_timers_in_due_order", [] {
                     common::EventLoop loop;
                     loop.start();
                     std::mutex mutex;
                     std::vector<int> order;
                     std::promise<void> done;
                     require(loop.post_after(std::chrono::milliseconds(60),
                                             [&] {
                                               std::lock_guard<std::mutex> lock(mutex);
                                               order.push_back(60);
                                               done.set_value();
                                             }),
                             "post_after should accept");
                     require(loop.post_after(std::chrono::milliseconds(10),
                                             [&] {
                                               std::lock_guard<std::mutex> lock(mutex);
                                               order.push_back(10);
                                             }),
                             "post_after should accept");
                     require(loop.post([&] {
                       std::lock_guard<std::mutex> lock(mutex);
                       order.push_back(0);
                     }),
                             "post should accept");
                     require(done.get_future().wait_for(std::chrono::seconds(2)) ==
                                 std::future_status::ready,
                             "timer should fire");
                     loop.stop();
                     require(order == std::vector<int>({0, 10, 60}), "tasks run by due time");
                     require(!loop.post([] {}), "stopped loop rejects tasks");
                   }});

  tests.push_back({"event_loop_current_is_set_on_worker_only", [] {
                     common::EventLoop loop;
                     loop.start();
                     require(common::EventLoop::current() == nullptr, "caller is on no loop");
                     std::promise<common::EventLoop *> seen;
                     require(loop.post([&] { seen.set_value(common::EventLoop::current()); }),
                             "post");
                     require(seen.get_future().get() == &loop, "worker sees its loop");
                     loop.stop();
                   }});

  tests.push_back({"blocking_without_loop_uses_scoped_loop", [] {
                     require(common::select_blocking_path(nullptr) ==
                                 common::BlockingPath::ScopedNoLoop,
                             "no loop means scoped");
                     auto result = common::run_blocking<int>(
                         nullptr, [](common::EventLoop &loop, common::Completion<int> done) {
                           loop.post_after(std::chrono::milliseconds(5),
                                           [done] { done(common::Result<int>::success(42)); });
                         });
                     require(result.ok() && result.value() == 42, "scoped loop completes");
                   }});

  tests.push_back({"blocking_uses_referenced_loop_when_running", [] {
                     common::EventLoop loop;
                     loop.start();
                     require(common::select_blocking_path(&loop) ==
                                 common::BlockingPath::ReferencedLoop,
                             "running loop is referenced");
                     auto result = common::run_blocking<bool>(
                         &loop, [&loop](common::EventLoop &used, common::Completion<bool> done) {
                           done(common::Result<bool>::success(&used == &loop &&
                                                              loop.in_loop_thread()));
                         });
                     loop.stop();
                     require(result.ok() && result.value(), "work ran on the referenced loop");
                   }});

  tests.push_back({"blocking_from_loop_thread_does_not_deadlock", [] {
                     common::EventLoop loop;
                     loop.start();
                     std::promise<common::Result<int>> outer;
                     std::atomic<bool> scoped_path{false};
                     require(loop.post([&] {
                       scoped_path = common::select_blocking_path(&loop) ==
                                     common::BlockingPath::ScopedFromLoopThread;
                       outer.set_value(common::run_blocking<int>(
                           &loop, [](common::EventLoop &, common::Completion<int> done) {
                             done(common::Result<int>::success(7));
                           }));
                     }),
                             "post");
                     auto future = outer.get_future();
                     require(future.wait_for(std::chrono::seconds(2)) == std::future_status::ready,
                             "nested blocking call should finish");
                     loop.stop();
                     const auto result = future.get();
                     require(scoped_path.load(), "loop thread must not block itself");
                     require(result.ok() && result.value() == 7, "value from scoped loop");
                   }});

  tests.push_back({"blocking_dropped_completion_fails", [] {
                     auto result = common::run_blocking<int>(
                         nullptr, [](common::EventLoop &, common::Completion<int>) {});
                     require(!result.ok(), "dropped completion must not hang");
                     require(result.error().find("stopped before completion") != std::string::npos,
                             result.error());
                   }});

  tests.push_back({"error_code_names_are_snake_case", [] {
                     require(common::error_code_name(common::ErrorCode::SessionNotFound) ==
                                 "session_not_found",
                             "session_not_found");
                     require(common::error_code_name(common::ErrorCode::RequestTimeout) ==
                                 "request_timeout",
                             "request_timeout");
                     auto failed = common::Result<int>::failure(common::ErrorCode::FileNotFound,
                                                                "File not found: x");
                     auto carried = common::Result<std::string>::propagate(failed);
                     require(carried.code() == common::ErrorCode::FileNotFound &&
                                 carried.error() == "File not found: x",
                             "propagate keeps code and message");
                   }});

  tests.push_back({"write_file_atomic_replaces_content", [] {
                     const auto dir = std::filesystem::temp_directory_path() /
                                      ("cdpgate-fs-" + std::to_string(std::hash<std::thread::id>{}(
                                                           std::this_thread::get_id())));
                     const auto file = dir / "nested" / "out.txt";
                     std::error_code ec;
                     std::filesystem::create_directories(file.parent_path(), ec);
                     require(common::write_file_atomic(file, "one").ok(), "first write");
                     require(common::write_file_atomic(file, "two").ok(), "second write");
                     auto read = common::read_file(file);
                     require(read.ok() && read.value() == "two", "content replaced");
                     require(!std::filesystem::exists(file.string() + ".tmp"), "no tmp left");
                     std::filesystem::remove_all(dir, ec);
                   }});
}
