#include "minitest.hpp"
#include "fixtures.hpp"
#include "probe/FfprobeInvoker.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>

using namespace std::chrono_literals;
using rtspmon::model::ErrorKind;
using rtspmon::model::StreamTarget;
using rtspmon::probe::FfprobeInvoker;
using rtspmon::probe::ProbeOptions;

static StreamTarget target() {
  return StreamTarget{"cam1", "rtsp://cam1.local:8554/live", 1000ms};
}

static FfprobeInvoker invoker_for(const std::string& tool, std::chrono::milliseconds timeout = 5s) {
  ProbeOptions opts;
  opts.ffprobe = tool;
  opts.timeout = timeout;
  opts.cancel_grace = 0ms;
  return FfprobeInvoker(opts);
}

TEST(invoker_command_line) {
  auto inv = invoker_for("ffprobe");
  auto cmd = inv.build_command("rtsp://h/s", true);
  std::vector<std::string> want{"ffprobe", "-v", "error", "-rtsp_transport", "tcp",
                                "-rw_timeout", "15000000", "-show_streams", "-show_format",
                                "-of", "json", "rtsp://h/s"};
  ASSERT_TRUE(cmd == want);
  auto plain = inv.build_command("rtsp://h/s", false);
  ASSERT_EQ(plain.size(), want.size() - 2);
  ASSERT_EQ(plain.back(), std::string("rtsp://h/s"));
}

TEST(invoker_success_parses_description) {
  TempDir dir("inv_ok");
  auto json = dir.write("out.json", kProbeJson1080p);
  auto args = dir.file("args");
  auto tool = dir.script("ffprobe", "echo \"$@\" > " + args + "\ncat " + json + "\n");
  auto inv = invoker_for(tool);
  auto r = inv.probe(target(), {});
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(*r.description.width, 1920);
  ASSERT_NEAR(*r.description.frame_rate, 29.97, 0.01);
  auto argline = read_file(args);
  ASSERT_TRUE(argline.find("-rtsp_transport tcp") != std::string::npos);
  ASSERT_TRUE(argline.find("rtsp://cam1.local:8554/live") != std::string::npos);
}

TEST(invoker_connection_refused) {
  TempDir dir("inv_refused");
  auto tool = dir.script("ffprobe",
      "echo 'rtsp://cam1.local:8554/live: Connection refused' 1>&2\nexit 1\n");
  auto r = invoker_for(tool).probe(target(), {});
  ASSERT_FALSE(r.ok());
  ASSERT_TRUE(r.failure.kind == ErrorKind::ConnectionRefused);
  ASSERT_EQ(*r.failure.exit_code, 1);
  ASSERT_TRUE(r.failure.message.find("Connection refused") != std::string::npos);
}

TEST(invoker_unclassified_nonzero_exit_is_process_error) {
  TempDir dir("inv_rc");
  auto tool = dir.script("ffprobe", "echo 'Invalid data found when processing input' 1>&2\nexit 69\n");
  auto r = invoker_for(tool).probe(target(), {});
  ASSERT_TRUE(r.failure.kind == ErrorKind::ProcessError);
  ASSERT_EQ(*r.failure.exit_code, 69);
}

TEST(invoker_empty_stdout_is_parse_error) {
  TempDir dir("inv_empty");
  auto tool = dir.script("ffprobe", "exit 0\n");
  auto r = invoker_for(tool).probe(target(), {});
  ASSERT_FALSE(r.ok());
  ASSERT_TRUE(r.failure.kind == ErrorKind::ParseError);
}

TEST(invoker_garbage_stdout_is_parse_error) {
  TempDir dir("inv_garbage");
  auto tool = dir.script("ffprobe", "echo 'not json at all'\n");
  auto r = invoker_for(tool).probe(target(), {});
  ASSERT_TRUE(r.failure.kind == ErrorKind::ParseError);
}

TEST(invoker_timeout_kills_tool) {
  TempDir dir("inv_timeout");
  auto pidfile = dir.file("pid");
  auto tool = dir.script("ffprobe", "echo $$ > " + pidfile + "\nexec sleep 30\n");
  auto t0 = std::chrono::steady_clock::now();
  auto r = invoker_for(tool, 300ms).probe(target(), {});
  ASSERT_TRUE(std::chrono::steady_clock::now() - t0 < 5s);
  ASSERT_FALSE(r.ok());
  ASSERT_TRUE(r.failure.kind == ErrorKind::Timeout);
  ASSERT_EQ(*r.failure.exit_code, 124);
  pid_t pid = static_cast<pid_t>(std::stoi(read_file(pidfile)));
  ASSERT_TRUE(::kill(pid, 0) < 0 && errno == ESRCH);
}

TEST(invoker_retries_without_rw_timeout) {
  TempDir dir("inv_retry");
  auto json = dir.write("out.json", kProbeJson1080p);
  auto calls = dir.file("calls");
  auto tool = dir.script("ffprobe",
      "echo call >> " + calls + "\n"
      "for a in \"$@\"; do\n"
      "  if [ \"$a\" = \"-rw_timeout\" ]; then echo \"Unrecognized option 'rw_timeout'.\" 1>&2; exit 1; fi\n"
      "done\n"
      "cat " + json + "\n");
  auto r = invoker_for(tool).probe(target(), {});
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(read_file(calls), std::string("call\ncall\n"));
}

TEST(invoker_missing_tool_is_process_error) {
  auto r = invoker_for("/nonexistent/ffprobe").probe(target(), {});
  ASSERT_FALSE(r.ok());
  ASSERT_TRUE(r.failure.kind == ErrorKind::ProcessError);
  ASSERT_FALSE(r.failure.exit_code.has_value());
}

TEST(invoker_stop_request_cancels) {
  TempDir dir("inv_cancel");
  auto tool = dir.script("ffprobe", "exec sleep 30\n");
  std::stop_source src;
  src.request_stop();
  auto r = invoker_for(tool, 10s).probe(target(), src.get_token());
  ASSERT_TRUE(r.cancelled());
}
