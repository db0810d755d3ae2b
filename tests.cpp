#undef NDEBUG
#include <assert.h>

#include <boost/filesystem.hpp>
#include <cstdint>
#include <fstream>
#include <iostream> // std::cerr
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>
#include <string>
#include <vector>

#include "config.hpp"
#include "vidcaps.hpp"

namespace {

// Hands out solid gray frames, a shade lighter on every call,
// and remembers where it was asked to seek.
struct SolidFrameSource {
  std::vector<int64_t> seeks;

  cv::Mat grab(int64_t timestamp_us) {
    seeks.push_back(timestamp_us);
    const double shade = 50.0 * seeks.size();
    return cv::Mat(90, 160, CV_8UC3, cv::Scalar(shade, shade, shade));
  }
};

boost::filesystem::path temp_file(const std::string &pattern) {
  return boost::filesystem::temp_directory_path() / boost::filesystem::unique_path(pattern);
}

MediaInfo sample_media() {
  MediaInfo info;
  info.path = "/tmp/videos/movie.mkv";
  info.size_bytes = 1572864;       // 1.5 MiB
  info.duration_us = 3661500000;   // 1h 1m 1.5s
  info.video.width = 1920;
  info.video.height = 1080;
  info.video.rate_num = 24000;
  info.video.rate_den = 1001;
  info.video.codec = "H264";
  info.video.profile = "High";
  info.video.bit_rate = 1500999;
  info.video.frames = 87800;
  info.audio.codec = "AAC";
  info.audio.profile = "LC";
  info.audio.bit_rate = 128000;
  info.audio.sample_rate = 48000;
  info.audio.channels = 2;
  return info;
}

// Font path configured by the build; text tests can't run without one.
const char *test_font() {
  const char *path = VIDCAPS_TEST_FONT;
  if (!boost::filesystem::exists(path)) {
    std::cerr << "no TrueType font at '" << path << "', set VIDCAPS_TEST_FONT" << std::endl;
  }
  assert(boost::filesystem::exists(path));
  return path;
}

boost::filesystem::path write_text(const std::string &pattern, const std::string &text) {
  const boost::filesystem::path path = temp_file(pattern);
  std::ofstream out(path.string());
  out << text;
  return path;
}

// Video-only MJPG clip, 64x36 at 25 fps.
boost::filesystem::path write_silent_clip(int frame_count) {
  const boost::filesystem::path path = temp_file("vidcaps-clip-%%%%-%%%%.avi");
  cv::VideoWriter writer(path.string(), cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), 25,
                         cv::Size(64, 36));
  assert(writer.isOpened());
  for (int i = 0; i < frame_count; i++) {
    writer.write(cv::Mat(36, 64, CV_8UC3, cv::Scalar(i % 256, 80, 160)));
  }
  writer.release();
  return path;
}

Config sheet_config(const std::string &font, const std::string &logo) {
  Config config;
  config.comment = "sheet";
  config.font = font;
  config.font_size = 18;
  config.matrix.rows = 2;
  config.matrix.cols = 2;
  config.matrix.padding = 5;
  config.matrix.block_width = 64;
  config.background_color = cv::Scalar(0, 0, 0);
  config.text_color = cv::Scalar(255, 255, 255);
  config.shuffle = false;
  config.logo.path = logo;
  config.logo.transparency = 1.0;
  return config;
}

void ignore_progress(double) {}

} // namespace

void test_sampler_is_deterministic_with_fixed_seed() {
  FrameSampler a = FrameSampler::fixed();
  FrameSampler b = FrameSampler::fixed();
  assert(a.sample(10000, 12) == b.sample(10000, 12));
  assert(FrameSampler::fixed().sample(90000, 30) == FrameSampler::fixed().sample(90000, 30));
}

void test_sampler_bounds_and_order() {
  const int64_t total = 2 * VIDCAPS_EDGE_FRAMES + 50;
  FrameSampler sampler = FrameSampler::shuffled();

  for (size_t rows = 1; rows <= 5; rows++) {
    for (size_t cols = 1; cols <= 5; cols++) {
      const auto frames = sampler.sample(total, rows * cols);
      assert(frames.size() == rows * cols);
      for (size_t i = 0; i < frames.size(); i++) {
        assert(frames[i] >= VIDCAPS_EDGE_FRAMES);
        assert(frames[i] < total - VIDCAPS_EDGE_FRAMES);
        if (i) assert(frames[i - 1] < frames[i]);
      }
    }
  }
}

void test_sampler_takes_whole_window_when_tight() {
  const auto frames = FrameSampler::fixed().sample(2 * VIDCAPS_EDGE_FRAMES + 4, 4);
  const std::vector<int64_t> expected{723, 724, 725, 726};
  assert(frames == expected);
}

void test_sampler_rejects_short_videos() {
  bool threw = false;
  try {
    FrameSampler::fixed().sample(2 * VIDCAPS_EDGE_FRAMES + 3, 4);
  } catch (InsufficientFramesError &) {
    threw = true;
  }
  assert(threw);

  // unknown frame count
  threw = false;
  try {
    FrameSampler::fixed().sample(0, 1);
  } catch (InsufficientFramesError &) {
    threw = true;
  }
  assert(threw);
}

void test_layout_dimensions() {
  GridConfig grid;
  grid.rows = 2;
  grid.cols = 3;
  grid.padding = 5;
  grid.block_width = 160;

  const SheetLayout layout = plan_layout(grid, 1920, 1080, 120);
  assert(layout.block_height == 90);
  assert(layout.width == (160 + 5) * 3 + 5);
  assert(layout.height == 120 + (90 + 5) * 2);

  assert(layout.cell_origin(0) == cv::Point(5, 120));
  assert(layout.cell_origin(2) == cv::Point(5 + 165 * 2, 120));
  assert(layout.cell_origin(4) == cv::Point(5 + 165, 120 + 95));

  // block height truncates: 160 / 1280 * 534 = 66.75
  assert(plan_layout(grid, 1280, 534, 0).block_height == 66);
}

void test_layout_rejects_flat_cells() {
  GridConfig grid;
  grid.rows = 1;
  grid.cols = 1;
  grid.padding = 0;
  grid.block_width = 2;

  bool threw = false;
  try {
    plan_layout(grid, 1920, 200, 50);
  } catch (ConfigError &) {
    threw = true;
  }
  assert(threw);
}

void test_metadata_record() {
  MediaInfo info = sample_media();
  const MetadataRecord record = format_metadata(info, "hello");

  const std::vector<std::string> labels{
    "File Name", "File Size", "Resolution", "Duration", "Video", "Audio", "Comment"};
  assert(labels_of(record) == labels);

  assert(record[0].second == ": movie.mkv");
  assert(record[1].second == ": 1.50 MB");
  assert(record[2].second == ": 1920x1080 / 23.98 fps");
  assert(record[3].second == ": 01:01:01");
  assert(record[4].second == ": H264 (High) :: 1500 kb/s, 23.98 fps");
  assert(record[5].second == ": AAC (LC) :: 128 kbps, 48000 Hz, 2 channels :: Und");
  assert(record[6].second == ": hello");

  info.audio.language = "eng";
  info.duration_us = 59999999;
  const MetadataRecord tagged = format_metadata(info, "");
  assert(tagged.size() == 7);
  assert(tagged[3].second == ": 00:00:59");
  assert(tagged[5].second == ": AAC (LC) :: 128 kbps, 48000 Hz, 2 channels :: Eng");
  assert(tagged[6].second == ": ");
}

void test_title_case() {
  assert(title_case("eng") == "Eng");
  assert(title_case("ENG") == "Eng");
  assert(title_case("pt-br") == "Pt-Br");
  assert(title_case("") == "");
}

void test_seek_timestamps() {
  VideoStreamInfo video;
  video.rate_num = 25;
  video.rate_den = 1;
  assert(seek_timestamp_us(750, video) == 30000000);
  assert(seek_timestamp_us(774, video) == 30000000);

  video.rate_num = 30000;
  video.rate_den = 1001;
  // 749 / 29.97 = 24.99 s
  assert(seek_timestamp_us(749, video) == 24000000);
}

void test_render_frames() {
  GridConfig grid;
  grid.rows = 2;
  grid.cols = 2;
  grid.padding = 4;
  grid.block_width = 32;

  VideoStreamInfo video;
  video.width = 160;
  video.height = 90;
  video.rate_num = 25;
  video.rate_den = 1;

  const SheetLayout layout = plan_layout(grid, video.width, video.height, 40);
  const cv::Scalar background(10, 20, 30);
  cv::Mat canvas(layout.height, layout.width, CV_8UC3, background);

  SolidFrameSource source;
  std::vector<double> progress;
  const std::vector<int64_t> frames{750, 800, 900, 1000};
  render_frames(canvas, source, layout, frames, video,
                [&progress](double p) { progress.push_back(p); });

  const std::vector<double> expected_progress{0.25, 0.5, 0.75, 1.0};
  assert(progress == expected_progress);

  const std::vector<int64_t> expected_seeks{30000000, 32000000, 36000000, 40000000};
  assert(source.seeks == expected_seeks);

  const cv::Vec3b bg(10, 20, 30);
  for (size_t idx = 0; idx < frames.size(); idx++) {
    const cv::Point origin = layout.cell_origin(idx);
    const uchar shade = static_cast<uchar>(50 * (idx + 1));
    const cv::Vec3b cell(shade, shade, shade);
    assert(canvas.at<cv::Vec3b>(origin) == cell);
    assert(canvas.at<cv::Vec3b>(origin + cv::Point(layout.block_width - 1,
                                                   layout.block_height - 1)) == cell);
    // padding left of the cell stays background
    assert(canvas.at<cv::Vec3b>(origin - cv::Point(1, 0)) == bg);
  }

  // header band is not touched by frames
  for (int x = 0; x < canvas.cols; x++) {
    assert(canvas.at<cv::Vec3b>(layout.header_height - 1, x) == bg);
  }
}

void test_parse_color() {
  assert(parse_color("#ff8000") == cv::Scalar(0x00, 0x80, 0xff));
  assert(parse_color("#F80") == cv::Scalar(0x00, 0x88, 0xff));
  assert(parse_color("white") == cv::Scalar(255, 255, 255));
  assert(parse_color("Black") == cv::Scalar(0, 0, 0));

  // full CSS name table
  assert(parse_color("navy") == cv::Scalar(0x80, 0, 0));
  assert(parse_color("darkgray") == cv::Scalar(0xa9, 0xa9, 0xa9));
  assert(parse_color("LightGoldenrodYellow") == cv::Scalar(0xd2, 0xfa, 0xfa));

  // alpha is dropped on the RGB canvas
  assert(parse_color("#11223344") == cv::Scalar(0x33, 0x22, 0x11));
  assert(parse_color("#f80c") == parse_color("#f80"));

  assert(parse_color("rgb(30,30,30)") == cv::Scalar(30, 30, 30));
  assert(parse_color("rgb( 1, 2, 3 )") == cv::Scalar(3, 2, 1));
  assert(parse_color("rgba(1,2,3,4)") == cv::Scalar(3, 2, 1));
  assert(parse_color("rgb(100%,0%,50%)") == cv::Scalar(128, 0, 255));
  assert(parse_color("hsl(0,100%,50%)") == cv::Scalar(0, 0, 255));
  assert(parse_color("hsl(120, 100%, 25%)") == cv::Scalar(0, 128, 0));
  assert(parse_color("hsv(240,100%,100%)") == cv::Scalar(255, 0, 0));
  assert(parse_color("hsb(0,0%,50%)") == cv::Scalar(128, 128, 128));

  const char *bad[] = {"#12", "#12345", "notacolor", "#gg0000", "",
                       "rgb(300,0,0)", "rgb(1,2)", "hsl(0,0,0)"};
  for (const char *spec : bad) {
    bool threw = false;
    try {
      parse_color(spec);
    } catch (ConfigError &) {
      threw = true;
    }
    assert(threw);
  }
}

const char *full_config =
    "comment: \"made by vidcaps\"\n"
    "font: fonts/DejaVuSans.ttf\n"
    "font_size: 18\n"
    "matrix:\n"
    "  row: 4\n"
    "  col: 3\n"
    "  padding: 5\n"
    "  block_width: 320\n"
    "background_color: \"#000000\"\n"
    "text_color: [255, 128, 0]\n"
    "shuffle: false\n"
    "logo:\n"
    "  path: logo.png\n"
    "  transparency: 0.5\n";

void test_load_config() {
  const boost::filesystem::path path = temp_file("vidcaps-%%%%-%%%%.yml");
  {
    std::ofstream out(path.string());
    out << full_config;
  }

  const Config config = load_config(path.string());
  boost::filesystem::remove(path);

  assert(config.comment == "made by vidcaps");
  assert(config.font == "fonts/DejaVuSans.ttf");
  assert(config.font_size == 18);
  assert(config.matrix.rows == 4);
  assert(config.matrix.cols == 3);
  assert(config.matrix.padding == 5);
  assert(config.matrix.block_width == 320);
  assert(config.background_color == cv::Scalar(0, 0, 0));
  assert(config.text_color == cv::Scalar(0, 128, 255));
  assert(!config.shuffle);
  assert(config.logo.path == "logo.png");
  assert(config.logo.transparency == 0.5);
}

void test_load_config_numeric_comment() {
  std::string text = full_config;
  const std::string comment = "comment: \"made by vidcaps\"\n";
  text.replace(text.find(comment), comment.size(), "comment: 1.5\n");

  const boost::filesystem::path path = write_text("vidcaps-%%%%-%%%%.yml", text);
  const Config config = load_config(path.string());
  boost::filesystem::remove(path);
  assert(config.comment == "1.5");
}

void test_load_config_missing_key() {
  std::string text = full_config;
  const std::string row = "  row: 4\n";
  text.erase(text.find(row), row.size());

  const boost::filesystem::path path = temp_file("vidcaps-%%%%-%%%%.yml");
  {
    std::ofstream out(path.string());
    out << text;
  }

  std::string message;
  try {
    load_config(path.string());
  } catch (ConfigError &e) {
    message = e.what();
  }
  boost::filesystem::remove(path);
  assert(message.find("matrix.row") != std::string::npos);

  bool threw = false;
  try {
    load_config("/nonexistent/vidcaps.yml");
  } catch (ConfigError &) {
    threw = true;
  }
  assert(threw);
}

void test_draw_logo() {
  const boost::filesystem::path path = temp_file("vidcaps-%%%%-%%%%.png");
  // opaque red, twice as wide as tall
  assert(cv::imwrite(path.string(), cv::Mat(20, 40, CV_8UC4, cv::Scalar(0, 0, 255, 255))));

  LogoConfig logo;
  logo.path = path.string();

  logo.transparency = 1.0;
  cv::Mat canvas(100, 200, CV_8UC3, cv::Scalar(0, 0, 0));
  draw_logo(canvas, logo, 20);
  assert(canvas.at<cv::Vec3b>(0, 199) == cv::Vec3b(0, 0, 255));
  assert(canvas.at<cv::Vec3b>(9, 180) == cv::Vec3b(0, 0, 255));
  assert(canvas.at<cv::Vec3b>(10, 199) == cv::Vec3b(0, 0, 0));
  assert(canvas.at<cv::Vec3b>(0, 179) == cv::Vec3b(0, 0, 0));

  logo.transparency = 0.0;
  cv::Mat untouched(100, 200, CV_8UC3, cv::Scalar(0, 0, 0));
  draw_logo(untouched, logo, 20);
  assert(cv::countNonZero(untouched.reshape(1)) == 0);

  boost::filesystem::remove(path);

  logo.path = "/nonexistent/logo.png";
  bool threw = false;
  try {
    draw_logo(canvas, logo, 20);
  } catch (MediaError &) {
    threw = true;
  }
  assert(threw);
}

void test_thumbnail_path() {
  const boost::filesystem::path out = thumbnail_path("/videos/clip.final.mp4", "out");
  assert(out == boost::filesystem::path("out") / "clip.final.png");
}

void test_header_font() {
  bool threw = false;
  try {
    HeaderFont missing("/nonexistent/font.ttf", 18);
  } catch (ConfigError &) {
    threw = true;
  }
  assert(threw);

  const char *path = test_font();

  const HeaderFont font(path, 18);
  const std::vector<std::string> one{"File Name"};
  const std::vector<std::string> labels = labels_of(format_metadata(sample_media(), ""));

  const TextBox small = font.measure(one);
  const TextBox box = font.measure(labels);
  assert(small.width > 15 && small.height > 30);
  assert(box.height > small.height);
  assert(box.height >= 30 + font.line_spacing() * 6);

  cv::Mat canvas(box.height, box.width, CV_8UC3, cv::Scalar(0, 0, 0));
  font.draw(canvas, labels, cv::Point(VIDCAPS_TEXT_ORIGIN, VIDCAPS_TEXT_ORIGIN),
            cv::Scalar(255, 255, 255));
  assert(cv::countNonZero(canvas.reshape(1)) > 0);
}

void test_save_thumbnail() {
  const boost::filesystem::path dir = temp_file("vidcaps-out-%%%%-%%%%");
  boost::filesystem::create_directories(dir);

  const boost::filesystem::path out = thumbnail_path("/videos/clip.mp4", dir.string());
  save_thumbnail(cv::Mat(30, 40, CV_8UC3, cv::Scalar(1, 2, 3)), out);
  const cv::Mat back = cv::imread(out.string());
  assert(back.cols == 40 && back.rows == 30);
  assert(back.at<cv::Vec3b>(0, 0) == cv::Vec3b(1, 2, 3));

  const boost::filesystem::path nowhere = dir / "missing" / "clip.png";
  bool threw = false;
  try {
    save_thumbnail(back, nowhere);
  } catch (std::exception &) {
    threw = true;
  }
  assert(threw);
  assert(!boost::filesystem::exists(nowhere));

  boost::filesystem::remove_all(dir);
}

void test_media_without_audio_is_rejected() {
  const boost::filesystem::path clip = write_silent_clip(10);

  bool threw = false;
  try {
    probe_media(clip.string());
  } catch (MissingStreamError &) {
    threw = true;
  }
  assert(threw);

  bool missing_file = false;
  try {
    probe_media("/nonexistent/clip.mp4");
  } catch (MediaError &) {
    missing_file = true;
  }
  assert(missing_file);

  boost::filesystem::remove(clip);
}

void test_frame_source_keeps_coded_size() {
  const boost::filesystem::path clip = write_silent_clip(50);

  VideoFrameSource source(clip.string());
  const cv::Mat first = source.grab(0);
  assert(first.cols == 64 && first.rows == 36);
  const cv::Mat later = source.grab(1000000);
  assert(later.cols == 64 && later.rows == 36);

  boost::filesystem::remove(clip);
}

void test_failed_run_writes_nothing() {
  const boost::filesystem::path clip = write_silent_clip(10);
  const boost::filesystem::path dir = temp_file("vidcaps-out-%%%%-%%%%");
  boost::filesystem::create_directories(dir);

  bool threw = false;
  try {
    write_thumbnail(clip.string(), sheet_config(test_font(), "/nonexistent/logo.png"),
                    dir.string(), ignore_progress);
  } catch (MissingStreamError &) {
    threw = true;
  }
  assert(threw);
  assert(!boost::filesystem::exists(thumbnail_path(clip.string(), dir.string())));
  assert(boost::filesystem::is_empty(dir));

  boost::filesystem::remove_all(dir);
  boost::filesystem::remove(clip);
}

void test_short_video_fails_before_drawing() {
  MediaInfo info = sample_media();
  info.video.frames = 2 * VIDCAPS_EDGE_FRAMES + 3;

  // font and logo don't exist: reaching the canvas would fail differently
  const Config config = sheet_config("/nonexistent/font.ttf", "/nonexistent/logo.png");
  SolidFrameSource source;

  bool threw = false;
  try {
    create_thumbnail(info, source, config, ignore_progress);
  } catch (InsufficientFramesError &) {
    threw = true;
  }
  assert(threw);
  assert(source.seeks.empty());
}

void test_create_thumbnail_sheet() {
  const boost::filesystem::path logo = temp_file("vidcaps-logo-%%%%-%%%%.png");
  assert(cv::imwrite(logo.string(), cv::Mat(8, 8, CV_8UC4, cv::Scalar(0, 0, 255, 255))));

  const MediaInfo info = sample_media();
  const Config config = sheet_config(test_font(), logo.string());

  SolidFrameSource source;
  std::vector<double> progress;
  const cv::Mat canvas = create_thumbnail(info, source, config,
                                          [&progress](double p) { progress.push_back(p); });

  const HeaderFont font(config.font, config.font_size);
  const int header = font.measure(labels_of(format_metadata(info, config.comment))).height;
  const int block_height = 36; // 64 * 1080 / 1920

  assert(canvas.cols == (64 + 5) * 2 + 5);
  assert(canvas.rows == header + (block_height + 5) * 2);

  const std::vector<double> expected_progress{0.25, 0.5, 0.75, 1.0};
  assert(progress == expected_progress);
  assert(source.seeks.size() == 4);

  // header text left of the logo
  const cv::Mat text_band = canvas(cv::Rect(0, 0, canvas.cols - 16, header));
  assert(cv::countNonZero(text_band.reshape(1)) > 0);

  // logo in the top-right corner
  assert(canvas.at<cv::Vec3b>(0, canvas.cols - 1) == cv::Vec3b(0, 0, 255));

  // four cells, each its own shade
  const SheetLayout layout = plan_layout(config.matrix, info.video.width, info.video.height, header);
  for (size_t idx = 0; idx < 4; idx++) {
    const uchar shade = static_cast<uchar>(50 * (idx + 1));
    const cv::Point center = layout.cell_origin(idx) + cv::Point(32, block_height / 2);
    assert(canvas.at<cv::Vec3b>(center) == cv::Vec3b(shade, shade, shade));
  }

  // same frames on a second run
  SolidFrameSource again;
  create_thumbnail(info, again, config, ignore_progress);
  assert(again.seeks == source.seeks);

  boost::filesystem::remove(logo);
}

int main() {
  test_sampler_is_deterministic_with_fixed_seed();
  test_sampler_bounds_and_order();
  test_sampler_takes_whole_window_when_tight();
  test_sampler_rejects_short_videos();
  test_layout_dimensions();
  test_layout_rejects_flat_cells();
  test_metadata_record();
  test_title_case();
  test_seek_timestamps();
  test_render_frames();
  test_parse_color();
  test_load_config();
  test_load_config_numeric_comment();
  test_load_config_missing_key();
  test_draw_logo();
  test_thumbnail_path();
  test_header_font();
  test_save_thumbnail();
  test_media_without_audio_is_rejected();
  test_frame_source_keeps_coded_size();
  test_failed_run_writes_nothing();
  test_short_video_fails_before_drawing();
  test_create_thumbnail_sheet();

  std::cerr << "all tests passed" << std::endl;
  return 0;
}
