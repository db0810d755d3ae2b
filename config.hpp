#pragma once

#include <opencv2/core.hpp>
#include <stdexcept>
#include <string>

struct ConfigError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct GridConfig {
  int rows = 0;
  int cols = 0;
  int padding = 0;
  int block_width = 0;
};

struct LogoConfig {
  std::string path;
  // 0 = invisible, 1 = logo alpha unchanged
  double transparency = 1.0;
};

struct Config {
  std::string comment;
  std::string font;
  int font_size = 0;
  GridConfig matrix;
  cv::Scalar background_color; // BGR
  cv::Scalar text_color;       // BGR
  bool shuffle = false;
  LogoConfig logo;
};

// Every key is required; a missing one throws ConfigError naming it
// with its dotted path, e.g. "matrix.row".
Config load_config(const std::string &path);

// "#rgb", "#rrggbb" or a color name. Returned as BGR.
cv::Scalar parse_color(const std::string &spec);
