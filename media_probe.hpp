#pragma once

#include <cstdint>
#include <opencv2/videoio.hpp>
#include <stdexcept>
#include <string>

struct MediaError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct MissingStreamError : MediaError {
  using MediaError::MediaError;
};

struct VideoStreamInfo {
  int width = 0;
  int height = 0;
  // average frame rate, kept as a rational so seeks can truncate exactly
  int rate_num = 0;
  int rate_den = 1;
  std::string codec;
  std::string profile;
  int64_t bit_rate = 0;
  // 0 when the container doesn't record a frame count
  int64_t frames = 0;

  double fps() const { return static_cast<double>(rate_num) / rate_den; }
};

struct AudioStreamInfo {
  std::string codec;
  std::string profile;
  int64_t bit_rate = 0;
  int sample_rate = 0;
  int channels = 0;
  // empty when the stream carries no language tag
  std::string language;
};

struct MediaInfo {
  std::string path;
  int64_t size_bytes = 0;
  int64_t duration_us = 0;
  VideoStreamInfo video;
  AudioStreamInfo audio;
};

// Reads container and first video/audio stream metadata via libavformat.
// Throws MissingStreamError if either stream is absent.
MediaInfo probe_media(const std::string &path);

// Decoded frames of one file, addressed by timestamp.
class VideoFrameSource {
 public:
  explicit VideoFrameSource(const std::string &path);

  // Returns the next frame at or after timestamp_us (BGR).
  cv::Mat grab(int64_t timestamp_us);

 private:
  std::string path_;
  cv::VideoCapture capture_;
};
