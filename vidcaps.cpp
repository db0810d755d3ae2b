#include <algorithm> // max, min
#include <cctype>
#include <iomanip>
#include <opencv2/imgcodecs.hpp>
#include <set>
#include <sstream>

#include "vidcaps.hpp"

MetadataRecord format_metadata(const MediaInfo &info, const std::string &comment) {
  const VideoStreamInfo &video = info.video;
  const AudioStreamInfo &audio = info.audio;

  std::ostringstream fps;
  fps << std::fixed << std::setprecision(2) << video.fps();

  std::ostringstream size;
  size << std::fixed << std::setprecision(2)
       << info.size_bytes / 1024.0 / 1024.0 << " MB";

  const int64_t seconds = info.duration_us / 1000000;
  std::ostringstream duration;
  duration << std::setfill('0')
           << std::setw(2) << seconds / 3600 << ":"
           << std::setw(2) << seconds % 3600 / 60 << ":"
           << std::setw(2) << seconds % 60;

  std::ostringstream video_desc;
  video_desc << video.codec << " (" << video.profile << ") :: "
             << video.bit_rate / 1000 << " kb/s, " << fps.str() << " fps";

  std::ostringstream audio_desc;
  audio_desc << audio.codec << " (" << audio.profile << ") :: "
             << audio.bit_rate / 1000 << " kbps, "
             << audio.sample_rate << " Hz, "
             << audio.channels << " channels :: "
             << title_case(audio.language.empty() ? "und" : audio.language);

  const std::string resolution = std::to_string(video.width) + "x" +
                                 std::to_string(video.height) + " / " + fps.str() + " fps";

  return MetadataRecord{
    {"File Name",  ": " + boost::filesystem::path(info.path).filename().string()},
    {"File Size",  ": " + size.str()},
    {"Resolution", ": " + resolution},
    {"Duration",   ": " + duration.str()},
    {"Video",      ": " + video_desc.str()},
    {"Audio",      ": " + audio_desc.str()},
    {"Comment",    ": " + comment},
  };
}

std::vector<std::string> labels_of(const MetadataRecord &record) {
  std::vector<std::string> labels;
  for (const auto &entry : record) labels.push_back(entry.first);
  return labels;
}

std::vector<std::string> values_of(const MetadataRecord &record) {
  std::vector<std::string> values;
  for (const auto &entry : record) values.push_back(entry.second);
  return values;
}

std::string title_case(const std::string &s) {
  std::string out = s;
  bool in_word = false;
  for (auto &c : out) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc)) {
      c = static_cast<char>(in_word ? std::tolower(uc) : std::toupper(uc));
      in_word = true;
    } else {
      in_word = false;
    }
  }
  return out;
}

HeaderFont::HeaderFont(const std::string &path, int size) : size_(size) {
  if (!boost::filesystem::exists(path)) {
    throw ConfigError("font file '" + path + "' does not exist");
  }
  ft2_ = cv::freetype::createFreeType2();
  ft2_->loadFontData(path, 0);
  // baseline of the first line sits one em below the origin
  ascent_ = size_;
}

TextBox HeaderFont::measure(const std::vector<std::string> &lines) const {
  int right = 0, top = 0, bottom = 0;
  bool any = false;

  for (size_t i = 0; i < lines.size(); i++) {
    if (lines[i].empty()) continue;

    int descent = 0;
    const cv::Size ink = ft2_->getTextSize(lines[i], size_, -1, &descent);
    const int baseline = static_cast<int>(i) * line_spacing() + ascent_;

    if (!any) {
      top = baseline - ink.height;
      bottom = baseline + descent;
      any = true;
    }
    right  = std::max(right, ink.width);
    top    = std::min(top, baseline - ink.height);
    bottom = std::max(bottom, baseline + descent);
  }

  return TextBox{right + 15, bottom - top + 30};
}

void HeaderFont::draw(cv::Mat &canvas, const std::vector<std::string> &lines,
                      cv::Point origin, const cv::Scalar &color) const {
  for (size_t i = 0; i < lines.size(); i++) {
    if (lines[i].empty()) continue;
    const cv::Point baseline(origin.x, origin.y + static_cast<int>(i) * line_spacing() + ascent_);
    // thickness -1 fills the glyphs
    ft2_->putText(canvas, lines[i], baseline, size_, color, -1, cv::LINE_AA, false);
  }
}

SheetLayout plan_layout(const GridConfig &grid, int video_width, int video_height,
                        int header_height) {
  SheetLayout layout;
  layout.rows          = grid.rows;
  layout.cols          = grid.cols;
  layout.padding       = grid.padding;
  layout.block_width   = grid.block_width;
  layout.block_height  = static_cast<int>(static_cast<double>(grid.block_width) /
                                          video_width * video_height);
  layout.header_height = header_height;

  if (layout.block_height < 1) {
    throw ConfigError("matrix.block_width " + std::to_string(grid.block_width) +
                      " is too small for a " + std::to_string(video_width) + "x" +
                      std::to_string(video_height) + " video");
  }

  layout.width  = (layout.block_width + layout.padding) * layout.cols + layout.padding;
  layout.height = header_height + (layout.block_height + layout.padding) * layout.rows;
  return layout;
}

// Floyd's selection: one draw per picked frame, no retries, uniform over
// all count-subsets of the window.
std::vector<int64_t> FrameSampler::sample(int64_t total_frames, size_t count) {
  const int64_t window = total_frames - 2 * VIDCAPS_EDGE_FRAMES;
  const int64_t wanted = static_cast<int64_t>(count);

  if (total_frames <= 0 || window < wanted) {
    std::ostringstream msg;
    msg << "video has " << total_frames << " frames; " << count
        << " frames are needed besides the first and last " << VIDCAPS_EDGE_FRAMES;
    throw InsufficientFramesError(msg.str());
  }

  std::set<int64_t> picked;
  for (int64_t j = window - wanted; j < window; j++) {
    std::uniform_int_distribution<int64_t> draw(0, j);
    if (!picked.insert(draw(engine_)).second) picked.insert(j);
  }

  std::vector<int64_t> frames;
  frames.reserve(count);
  for (const auto offset : picked) frames.push_back(VIDCAPS_EDGE_FRAMES + offset);
  return frames;
}

int64_t seek_timestamp_us(int64_t frame_index, const VideoStreamInfo &video) {
  // frame / (num / den) seconds, truncated
  const int64_t seconds = frame_index * video.rate_den / video.rate_num;
  return seconds * 1000000;
}

void draw_logo(cv::Mat &canvas, const LogoConfig &config, int width) {
  cv::Mat logo = cv::imread(config.path, cv::IMREAD_UNCHANGED);
  if (logo.empty()) {
    throw MediaError("could not read logo image '" + config.path + "'");
  }

  if (logo.depth() == CV_16U) logo.convertTo(logo, CV_8U, 1.0 / 257);
  if (logo.channels() == 1) {
    cv::cvtColor(logo, logo, cv::COLOR_GRAY2BGRA);
  } else if (logo.channels() == 3) {
    cv::cvtColor(logo, logo, cv::COLOR_BGR2BGRA);
  }

  const int height = static_cast<int>(static_cast<double>(logo.rows) / logo.cols * width);
  if (width < 1 || height < 1) return;
  cv::resize(logo, logo, cv::Size(width, height), 0, 0, cv::INTER_CUBIC);

  // anchored top-right, clipped to the canvas
  const int x0 = canvas.cols - width;
  const cv::Rect target = cv::Rect(x0, 0, width, height) & cv::Rect(0, 0, canvas.cols, canvas.rows);
  if (target.empty()) return;

  const cv::Mat src = logo(cv::Rect(target.x - x0, 0, target.width, target.height));
  cv::Mat dst = canvas(target);

  for (int y = 0; y < dst.rows; y++) {
    const cv::Vec4b *s = src.ptr<cv::Vec4b>(y);
    cv::Vec3b *d = dst.ptr<cv::Vec3b>(y);
    for (int x = 0; x < dst.cols; x++) {
      const int a = cv::saturate_cast<uchar>(s[x][3] * config.transparency);
      for (int ch = 0; ch < 3; ch++) {
        d[x][ch] = static_cast<uchar>((s[x][ch] * a + d[x][ch] * (255 - a) + 127) / 255);
      }
    }
  }
}

boost::filesystem::path thumbnail_path(const std::string &video_path,
                                       const std::string &output_folder) {
  const boost::filesystem::path video(video_path);
  return boost::filesystem::path(output_folder) / (video.stem().string() + ".png");
}

void save_thumbnail(const cv::Mat &canvas, const boost::filesystem::path &path) {
  if (!cv::imwrite(path.string(), canvas)) {
    throw MediaError("could not write '" + path.string() + "'");
  }
}
