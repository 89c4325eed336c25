#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

// Scratch directory under /tmp, removed on destruction. Fake ffprobe/ffmpeg
// binaries are shell scripts written into it.
struct TempDir {
  std::string path;

  explicit TempDir(const std::string& tag) {
    path = "/tmp/rtspmon_test_" + tag + "_" + std::to_string(::getpid());
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    std::filesystem::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  std::string file(const std::string& name) const { return path + "/" + name; }

  std::string write(const std::string& name, const std::string& content) const {
    auto p = file(name);
    std::ofstream f(p);
    f << content;
    return p;
  }

  // Executable "#!/bin/sh" script.
  std::string script(const std::string& name, const std::string& body) const {
    auto p = write(name, "#!/bin/sh\n" + body);
    ::chmod(p.c_str(), 0755);
    return p;
  }
};

inline std::string read_file(const std::string& path) {
  std::ifstream f(path);
  return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

inline constexpr const char* kProbeJson1080p = R"({
  "streams": [
    {"index": 0, "codec_name": "h264", "codec_type": "video", "width": 1920, "height": 1080,
     "avg_frame_rate": "30000/1001", "r_frame_rate": "30000/1001"},
    {"index": 1, "codec_name": "aac", "codec_type": "audio", "sample_rate": "48000", "channels": 2}
  ],
  "format": {"format_name": "rtsp", "bit_rate": "2000000"}
})";
