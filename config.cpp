#include <algorithm> // transform
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <map>
#include <regex>
#include <sstream>
#include <string>

#include "config.hpp"

namespace {

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

cv::FileNode require(const cv::FileNode &parent, const std::string &key,
                     const std::string &dotted) {
  cv::FileNode node = parent[key];
  if (node.empty() || node.isNone()) {
    throw ConfigError("missing config key: " + dotted);
  }
  return node;
}

std::string read_string(const cv::FileNode &node, const std::string &dotted) {
  if (node.isString()) return node.string();
  if (node.isInt()) return std::to_string(static_cast<int>(node));
  if (node.isReal()) {
    // default stream precision: 1.5 stays "1.5"
    std::ostringstream out;
    out << static_cast<double>(node);
    return out.str();
  }
  throw ConfigError("config key " + dotted + " must be a string");
}

int read_int(const cv::FileNode &node, const std::string &dotted, int min) {
  if (!node.isInt()) throw ConfigError("config key " + dotted + " must be an integer");
  int value = static_cast<int>(node);
  if (value < min) {
    throw ConfigError("config key " + dotted + " must be >= " + std::to_string(min));
  }
  return value;
}

double read_real(const cv::FileNode &node, const std::string &dotted) {
  if (!node.isInt() && !node.isReal()) {
    throw ConfigError("config key " + dotted + " must be a number");
  }
  return static_cast<double>(node);
}

// FileStorage has no boolean type, so YAML true/false arrive as strings.
bool read_bool(const cv::FileNode &node, const std::string &dotted) {
  if (node.isInt()) return static_cast<int>(node) != 0;
  if (node.isString()) {
    const std::string s = lowercase(node.string());
    if (s == "true" || s == "yes" || s == "on") return true;
    if (s == "false" || s == "no" || s == "off") return false;
  }
  throw ConfigError("config key " + dotted + " must be a boolean");
}

cv::Scalar read_color(const cv::FileNode &node, const std::string &dotted) {
  if (node.isSeq()) {
    if (node.size() != 3) {
      throw ConfigError("config key " + dotted + " must list 3 components");
    }
    int rgb[3];
    for (int i = 0; i < 3; i++) {
      rgb[i] = static_cast<int>(node[i]);
      if (rgb[i] < 0 || rgb[i] > 255) {
        throw ConfigError("config key " + dotted + " has a component outside 0..255");
      }
    }
    return cv::Scalar(rgb[2], rgb[1], rgb[0]);
  }
  try {
    return parse_color(read_string(node, dotted));
  } catch (const ConfigError &e) {
    throw ConfigError("config key " + dotted + ": " + e.what());
  }
}

// CSS/X11 color names, 0xRRGGBB
const std::map<std::string, uint32_t> &named_colors() {
  static const std::map<std::string, uint32_t> names = {
    {"aliceblue", 0xf0f8ff}, {"antiquewhite", 0xfaebd7}, {"aqua", 0x00ffff},
    {"aquamarine", 0x7fffd4}, {"azure", 0xf0ffff}, {"beige", 0xf5f5dc},
    {"bisque", 0xffe4c4}, {"black", 0x000000}, {"blanchedalmond", 0xffebcd},
    {"blue", 0x0000ff}, {"blueviolet", 0x8a2be2}, {"brown", 0xa52a2a},
    {"burlywood", 0xdeb887}, {"cadetblue", 0x5f9ea0}, {"chartreuse", 0x7fff00},
    {"chocolate", 0xd2691e}, {"coral", 0xff7f50}, {"cornflowerblue", 0x6495ed},
    {"cornsilk", 0xfff8dc}, {"crimson", 0xdc143c}, {"cyan", 0x00ffff},
    {"darkblue", 0x00008b}, {"darkcyan", 0x008b8b}, {"darkgoldenrod", 0xb8860b},
    {"darkgray", 0xa9a9a9}, {"darkgrey", 0xa9a9a9}, {"darkgreen", 0x006400},
    {"darkkhaki", 0xbdb76b}, {"darkmagenta", 0x8b008b}, {"darkolivegreen", 0x556b2f},
    {"darkorange", 0xff8c00}, {"darkorchid", 0x9932cc}, {"darkred", 0x8b0000},
    {"darksalmon", 0xe9967a}, {"darkseagreen", 0x8fbc8f}, {"darkslateblue", 0x483d8b},
    {"darkslategray", 0x2f4f4f}, {"darkslategrey", 0x2f4f4f},
    {"darkturquoise", 0x00ced1}, {"darkviolet", 0x9400d3}, {"deeppink", 0xff1493},
    {"deepskyblue", 0x00bfff}, {"dimgray", 0x696969}, {"dimgrey", 0x696969},
    {"dodgerblue", 0x1e90ff}, {"firebrick", 0xb22222}, {"floralwhite", 0xfffaf0},
    {"forestgreen", 0x228b22}, {"fuchsia", 0xff00ff}, {"gainsboro", 0xdcdcdc},
    {"ghostwhite", 0xf8f8ff}, {"gold", 0xffd700}, {"goldenrod", 0xdaa520},
    {"gray", 0x808080}, {"grey", 0x808080}, {"green", 0x008000},
    {"greenyellow", 0xadff2f}, {"honeydew", 0xf0fff0}, {"hotpink", 0xff69b4},
    {"indianred", 0xcd5c5c}, {"indigo", 0x4b0082}, {"ivory", 0xfffff0},
    {"khaki", 0xf0e68c}, {"lavender", 0xe6e6fa}, {"lavenderblush", 0xfff0f5},
    {"lawngreen", 0x7cfc00}, {"lemonchiffon", 0xfffacd}, {"lightblue", 0xadd8e6},
    {"lightcoral", 0xf08080}, {"lightcyan", 0xe0ffff},
    {"lightgoldenrodyellow", 0xfafad2}, {"lightgreen", 0x90ee90},
    {"lightgray", 0xd3d3d3}, {"lightgrey", 0xd3d3d3}, {"lightpink", 0xffb6c1},
    {"lightsalmon", 0xffa07a}, {"lightseagreen", 0x20b2aa}, {"lightskyblue", 0x87cefa},
    {"lightslategray", 0x778899}, {"lightslategrey", 0x778899},
    {"lightsteelblue", 0xb0c4de}, {"lightyellow", 0xffffe0}, {"lime", 0x00ff00},
    {"limegreen", 0x32cd32}, {"linen", 0xfaf0e6}, {"magenta", 0xff00ff},
    {"maroon", 0x800000}, {"mediumaquamarine", 0x66cdaa}, {"mediumblue", 0x0000cd},
    {"mediumorchid", 0xba55d3}, {"mediumpurple", 0x9370db},
    {"mediumseagreen", 0x3cb371}, {"mediumslateblue", 0x7b68ee},
    {"mediumspringgreen", 0x00fa9a}, {"mediumturquoise", 0x48d1cc},
    {"mediumvioletred", 0xc71585}, {"midnightblue", 0x191970}, {"mintcream", 0xf5fffa},
    {"mistyrose", 0xffe4e1}, {"moccasin", 0xffe4b5}, {"navajowhite", 0xffdead},
    {"navy", 0x000080}, {"oldlace", 0xfdf5e6}, {"olive", 0x808000},
    {"olivedrab", 0x6b8e23}, {"orange", 0xffa500}, {"orangered", 0xff4500},
    {"orchid", 0xda70d6}, {"palegoldenrod", 0xeee8aa}, {"palegreen", 0x98fb98},
    {"paleturquoise", 0xafeeee}, {"palevioletred", 0xdb7093}, {"papayawhip", 0xffefd5},
    {"peachpuff", 0xffdab9}, {"peru", 0xcd853f}, {"pink", 0xffc0cb}, {"plum", 0xdda0dd},
    {"powderblue", 0xb0e0e6}, {"purple", 0x800080}, {"rebeccapurple", 0x663399},
    {"red", 0xff0000}, {"rosybrown", 0xbc8f8f}, {"royalblue", 0x4169e1},
    {"saddlebrown", 0x8b4513}, {"salmon", 0xfa8072}, {"sandybrown", 0xf4a460},
    {"seagreen", 0x2e8b57}, {"seashell", 0xfff5ee}, {"sienna", 0xa0522d},
    {"silver", 0xc0c0c0}, {"skyblue", 0x87ceeb}, {"slateblue", 0x6a5acd},
    {"slategray", 0x708090}, {"slategrey", 0x708090}, {"snow", 0xfffafa},
    {"springgreen", 0x00ff7f}, {"steelblue", 0x4682b4}, {"tan", 0xd2b48c},
    {"teal", 0x008080}, {"thistle", 0xd8bfd8}, {"tomato", 0xff6347},
    {"turquoise", 0x40e0d0}, {"violet", 0xee82ee}, {"wheat", 0xf5deb3},
    {"white", 0xffffff}, {"whitesmoke", 0xf5f5f5}, {"yellow", 0xffff00},
    {"yellowgreen", 0x9acd32},
  };
  return names;
}

cv::Scalar from_rgb(double r, double g, double b) {
  return cv::Scalar(static_cast<int>(b * 255 + 0.5), static_cast<int>(g * 255 + 0.5),
                    static_cast<int>(r * 255 + 0.5));
}

double hue_channel(double m1, double m2, double hue) {
  hue -= std::floor(hue);
  if (hue < 1.0 / 6) return m1 + (m2 - m1) * hue * 6;
  if (hue < 0.5) return m2;
  if (hue < 2.0 / 3) return m1 + (m2 - m1) * (2.0 / 3 - hue) * 6;
  return m1;
}

// h in [0, 360), s and l in [0, 100]
cv::Scalar from_hsl(double h, double s, double l) {
  h /= 360;
  s /= 100;
  l /= 100;
  if (s == 0) return from_rgb(l, l, l);
  const double m2 = l <= 0.5 ? l * (1 + s) : l + s - l * s;
  const double m1 = 2 * l - m2;
  return from_rgb(hue_channel(m1, m2, h + 1.0 / 3), hue_channel(m1, m2, h),
                  hue_channel(m1, m2, h - 1.0 / 3));
}

// h in [0, 360), s and v in [0, 100]
cv::Scalar from_hsv(double h, double s, double v) {
  h /= 360;
  s /= 100;
  v /= 100;
  if (s == 0) return from_rgb(v, v, v);
  const int sector = static_cast<int>(h * 6) % 6;
  const double f = h * 6 - std::floor(h * 6);
  const double p = v * (1 - s), q = v * (1 - s * f), t = v * (1 - s * (1 - f));
  switch (sector) {
    case 0:  return from_rgb(v, t, p);
    case 1:  return from_rgb(q, v, p);
    case 2:  return from_rgb(p, v, t);
    case 3:  return from_rgb(p, q, v);
    case 4:  return from_rgb(t, p, v);
    default: return from_rgb(v, p, q);
  }
}

} // namespace

cv::Scalar parse_color(const std::string &spec) {
  const std::string s = lowercase(spec);
  const ConfigError unknown("unknown color specifier: \"" + spec + "\"");

  const auto &names = named_colors();
  auto it = names.find(s);
  if (it != names.end()) {
    const uint32_t rgb = it->second;
    return cv::Scalar(rgb & 0xff, (rgb >> 8) & 0xff, (rgb >> 16) & 0xff);
  }

  if (!s.empty() && s[0] == '#') {
    if (s.find_first_not_of("0123456789abcdef", 1) != std::string::npos) throw unknown;
    std::string hex = s.substr(1);
    // #rgb / #rgba expand each digit: #f80 == #ff8800
    if (hex.size() == 3 || hex.size() == 4) {
      std::string wide;
      for (char c : hex) wide += std::string(2, c);
      hex = wide;
    }
    if (hex.size() != 6 && hex.size() != 8) throw unknown;
    // alpha has no effect on the RGB canvas
    const long rgb = std::strtol(hex.substr(0, 6).c_str(), nullptr, 16);
    return cv::Scalar(rgb & 0xff, (rgb >> 8) & 0xff, (rgb >> 16) & 0xff);
  }

  static const std::regex rgb_int(R"(rgb\(\s*(\d+)\s*,\s*(\d+)\s*,\s*(\d+)\s*\))");
  static const std::regex rgb_pct(R"(rgb\(\s*(\d+)%\s*,\s*(\d+)%\s*,\s*(\d+)%\s*\))");
  static const std::regex rgba_int(
      R"(rgba\(\s*(\d+)\s*,\s*(\d+)\s*,\s*(\d+)\s*,\s*(\d+)\s*\))");
  static const std::regex hsl(
      R"(hsl\(\s*(\d+\.?\d*)\s*,\s*(\d+\.?\d*)%\s*,\s*(\d+\.?\d*)%\s*\))");
  static const std::regex hsv(
      R"(hs[bv]\(\s*(\d+\.?\d*)\s*,\s*(\d+\.?\d*)%\s*,\s*(\d+\.?\d*)%\s*\))");

  std::smatch m;
  if (std::regex_match(s, m, rgb_int) || std::regex_match(s, m, rgba_int)) {
    int c[3];
    for (int i = 0; i < 3; i++) {
      c[i] = std::stoi(m[i + 1].str());
      if (c[i] > 255) throw unknown;
    }
    return cv::Scalar(c[2], c[1], c[0]);
  }
  if (std::regex_match(s, m, rgb_pct)) {
    int c[3];
    for (int i = 0; i < 3; i++) {
      const int pct = std::stoi(m[i + 1].str());
      if (pct > 100) throw unknown;
      c[i] = static_cast<int>(pct * 255 / 100.0 + 0.5);
    }
    return cv::Scalar(c[2], c[1], c[0]);
  }
  if (std::regex_match(s, m, hsl)) {
    return from_hsl(std::stod(m[1].str()), std::min(100.0, std::stod(m[2].str())),
                    std::min(100.0, std::stod(m[3].str())));
  }
  if (std::regex_match(s, m, hsv)) {
    return from_hsv(std::stod(m[1].str()), std::min(100.0, std::stod(m[2].str())),
                    std::min(100.0, std::stod(m[3].str())));
  }

  throw unknown;
}

Config load_config(const std::string &path) {
  std::ifstream in(path);
  if (!in) throw ConfigError("could not open config file '" + path + "'");
  std::ostringstream text;
  text << in.rdbuf();

  // FileStorage only recognizes YAML that starts with a %YAML directive;
  // plain config files usually don't carry one.
  std::string yaml = text.str();
  if (yaml.compare(0, 5, "%YAML") != 0) yaml = "%YAML:1.0\n" + yaml;

  cv::FileStorage fs(yaml, cv::FileStorage::READ | cv::FileStorage::MEMORY |
                               cv::FileStorage::FORMAT_YAML);
  if (!fs.isOpened()) throw ConfigError("could not parse config file '" + path + "'");

  const cv::FileNode root = fs.root();
  Config config;

  config.comment   = read_string(require(root, "comment", "comment"), "comment");
  config.font      = read_string(require(root, "font", "font"), "font");
  config.font_size = read_int(require(root, "font_size", "font_size"), "font_size", 1);

  const cv::FileNode matrix = require(root, "matrix", "matrix");
  config.matrix.rows        = read_int(require(matrix, "row", "matrix.row"), "matrix.row", 1);
  config.matrix.cols        = read_int(require(matrix, "col", "matrix.col"), "matrix.col", 1);
  config.matrix.padding     = read_int(require(matrix, "padding", "matrix.padding"),
                                       "matrix.padding", 0);
  config.matrix.block_width = read_int(require(matrix, "block_width", "matrix.block_width"),
                                       "matrix.block_width", 1);

  config.background_color =
      read_color(require(root, "background_color", "background_color"), "background_color");
  config.text_color = read_color(require(root, "text_color", "text_color"), "text_color");
  config.shuffle    = read_bool(require(root, "shuffle", "shuffle"), "shuffle");

  const cv::FileNode logo = require(root, "logo", "logo");
  config.logo.path = read_string(require(logo, "path", "logo.path"), "logo.path");
  config.logo.transparency =
      read_real(require(logo, "transparency", "logo.transparency"), "logo.transparency");
  if (config.logo.transparency < 0.0 || config.logo.transparency > 1.0) {
    throw ConfigError("config key logo.transparency must be within [0, 1]");
  }

  return config;
}
