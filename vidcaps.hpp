#pragma once

// Frames this close to either end of the video are never sampled
// (intros, credits, black leader).
#define VIDCAPS_EDGE_FRAMES  723
#define VIDCAPS_FIXED_SEED   23
// Top-left corner of the header text.
#define VIDCAPS_TEXT_ORIGIN  10

#include <cstdint>
#include <iostream>
#include <opencv2/freetype.hpp>
#include <opencv2/imgproc.hpp>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/filesystem.hpp>

#include "config.hpp"
#include "media_probe.hpp"

struct InsufficientFramesError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// (label, value) pairs in display order:
// File Name, File Size, Resolution, Duration, Video, Audio, Comment
typedef std::vector<std::pair<std::string, std::string>> MetadataRecord;

MetadataRecord format_metadata(const MediaInfo &info, const std::string &comment);

std::vector<std::string> labels_of(const MetadataRecord &record);
std::vector<std::string> values_of(const MetadataRecord &record);

// "eng" -> "Eng", "pt-br" -> "Pt-Br"
std::string title_case(const std::string &s);

struct TextBox {
  int width;
  int height;
};

// TrueType font used for the header text.
class HeaderFont {
 public:
  HeaderFont(const std::string &path, int size);

  // Ink extent of the lines plus a 15px/30px margin.
  TextBox measure(const std::vector<std::string> &lines) const;

  void draw(cv::Mat &canvas, const std::vector<std::string> &lines,
            cv::Point origin, const cv::Scalar &color) const;

  int line_spacing() const { return size_ + 4; }

 private:
  cv::Ptr<cv::freetype::FreeType2> ft2_;
  int size_;
  int ascent_;
};

/*
 * Canvas layout for a 2x3 grid:
 *
 *   +------------------------------------------+
 *   | File Name  : ...                   [logo]|
 *   | ...                                      |  header_height
 *   | Comment    : ...                         |
 *   |                                          |
 *   |  +------+  +------+  +------+            |
 *   |  |  0   |  |  1   |  |  2   |            |  block_height
 *   |  +------+  +------+  +------+            |
 *   |  +------+  +------+  +------+            |
 *   |  |  3   |  |  4   |  |  5   |            |
 *   |  +------+  +------+  +------+            |
 *   +------------------------------------------+
 *
 *  The grid starts right below the header; padding is left
 *  of every column and below every row.
 */
struct SheetLayout {
  int rows;
  int cols;
  int padding;
  int block_width;
  int block_height;
  int header_height;
  int width;
  int height;

  // Top-left corner of cell idx, row-major.
  cv::Point cell_origin(size_t idx) const {
    const int c = static_cast<int>(idx % cols);
    const int r = static_cast<int>(idx / cols);
    return cv::Point(padding + (padding + block_width) * c,
                     header_height + (padding + block_height) * r);
  }
};

SheetLayout plan_layout(const GridConfig &grid, int video_width, int video_height,
                        int header_height);

// Picks which frames end up on the sheet.
class FrameSampler {
 public:
  explicit FrameSampler(uint64_t seed) : engine_(seed) {}

  // Same frames on every run.
  static FrameSampler fixed() { return FrameSampler(VIDCAPS_FIXED_SEED); }
  static FrameSampler shuffled() {
    std::random_device rd;
    return FrameSampler((static_cast<uint64_t>(rd()) << 32) | rd());
  }

  // count distinct indices from [EDGE, total_frames - EDGE), ascending.
  std::vector<int64_t> sample(int64_t total_frames, size_t count);

 private:
  std::mt19937_64 engine_;
};

// Whole seconds of frame_index / average rate, in microseconds.
int64_t seek_timestamp_us(int64_t frame_index, const VideoStreamInfo &video);

void draw_logo(cv::Mat &canvas, const LogoConfig &logo, int width);

// <output_folder>/<stem of video_path>.png
boost::filesystem::path thumbnail_path(const std::string &video_path,
                                       const std::string &output_folder);

void save_thumbnail(const cv::Mat &canvas, const boost::filesystem::path &path);

// FrameSource needs  cv::Mat grab(int64_t timestamp_us)
// ProgressFn  needs  void(double fraction)
template <typename FrameSource, typename ProgressFn>
void render_frames(cv::Mat &canvas, FrameSource &source, const SheetLayout &layout,
                   const std::vector<int64_t> &frames, const VideoStreamInfo &video,
                   ProgressFn &&on_progress) {
  const cv::Size cell(layout.block_width, layout.block_height);

  for (size_t idx = 0; idx < frames.size(); idx++) {
    cv::Mat shot = source.grab(seek_timestamp_us(frames[idx], video));

    cv::Mat resized;
    cv::resize(shot, resized, cell, 0, 0, cv::INTER_LINEAR);
    resized.copyTo(canvas(cv::Rect(layout.cell_origin(idx), cell)));

    on_progress(static_cast<double>(idx + 1) / frames.size());
  }
}

// Builds the whole sheet in memory from already probed media. Nothing is
// written to disk here, so a failure part way through leaves no output behind.
template <typename FrameSource, typename ProgressFn>
cv::Mat create_thumbnail(const MediaInfo &info, FrameSource &source, const Config &config,
                         ProgressFn &&on_progress) {
  const MetadataRecord metadata = format_metadata(info, config.comment);

  // sample before anything is drawn: a short video fails without a canvas
  FrameSampler sampler = config.shuffle ? FrameSampler::shuffled() : FrameSampler::fixed();
  const size_t count = static_cast<size_t>(config.matrix.rows) * config.matrix.cols;
  const std::vector<int64_t> frames = sampler.sample(info.video.frames, count);

  std::cerr << "Capturing frames:";
  for (const auto frame : frames) std::cerr << " " << frame;
  std::cerr << std::endl;

  const HeaderFont font(config.font, config.font_size);
  const std::vector<std::string> labels = labels_of(metadata);
  const TextBox label_box = font.measure(labels);
  const SheetLayout layout =
      plan_layout(config.matrix, info.video.width, info.video.height, label_box.height);

  cv::Mat canvas(layout.height, layout.width, CV_8UC3, config.background_color);
  font.draw(canvas, labels, cv::Point(VIDCAPS_TEXT_ORIGIN, VIDCAPS_TEXT_ORIGIN),
            config.text_color);
  font.draw(canvas, values_of(metadata), cv::Point(label_box.width, VIDCAPS_TEXT_ORIGIN),
            config.text_color);
  draw_logo(canvas, config.logo, config.matrix.block_width / 4);

  render_frames(canvas, source, layout, frames, info.video,
                std::forward<ProgressFn>(on_progress));
  return canvas;
}

template <typename ProgressFn>
cv::Mat create_thumbnail(const std::string &video_path, const Config &config,
                         ProgressFn &&on_progress) {
  const MediaInfo info = probe_media(video_path);
  VideoFrameSource source(video_path);
  return create_thumbnail(info, source, config, std::forward<ProgressFn>(on_progress));
}

// create_thumbnail, then save_thumbnail into output_folder.
// Returns the path written.
template <typename ProgressFn>
boost::filesystem::path write_thumbnail(const std::string &video_path, const Config &config,
                                        const std::string &output_folder,
                                        ProgressFn &&on_progress) {
  const cv::Mat canvas =
      create_thumbnail(video_path, config, std::forward<ProgressFn>(on_progress));
  const boost::filesystem::path out = thumbnail_path(video_path, output_folder);
  save_thumbnail(canvas, out);
  return out;
}
