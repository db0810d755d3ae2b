#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <boost/timer/progress_display.hpp>
#include <cstdint>
#include <exception>
#include <iostream> // std::cerr
#include <memory>
#include <string>

#include "config.hpp"
#include "vidcaps.hpp"

int main(int32_t argc, char **argv) {
  // Usage / handle CLI
  boost::program_options::variables_map vm;
  {
    using namespace boost::program_options;

    options_description desc{"Make thumbnails (caps, previews) of video file"};
    desc.add_options()
        ("help,h", "Help screen")
        ("video",
          value<std::string>()->required(),
          "video file")
        ("config",
          value<std::string>()->default_value("config.yml"),
          "config yaml file")
        ("output_folder",
          value<std::string>()->default_value("."),
          "thumbnail output folder");

    try {
      store(parse_command_line(argc, argv, desc), vm);

      if (vm.count("help")) {
        std::cerr << desc << std::endl;
        return 0;
      }

      notify(vm);
    } catch (boost::program_options::error &e) {
      std::cerr << e.what() << std::endl << desc << std::endl;
      return 1;
    }
  }

  const auto &video = vm["video"].as<std::string>();
  const auto &config_path = vm["config"].as<std::string>();
  const auto &output_folder = vm["output_folder"].as<std::string>();

  if (!boost::filesystem::exists(video)) {
    std::cerr << "Couldn't ensure file at " << video << " exists!" << std::endl;
    return 1;
  }

  try {
    const Config config = load_config(config_path);
    std::cerr << "Proceeding with " << video << std::endl;

    // created on the first frame so earlier log lines don't split the bar
    std::unique_ptr<boost::timer::progress_display> bar;
    const boost::filesystem::path out =
        write_thumbnail(video, config, output_folder, [&bar](double progress) {
          if (!bar) bar = std::make_unique<boost::timer::progress_display>(100, std::cerr);
          const unsigned long percent = static_cast<unsigned long>(progress * 100);
          if (percent > bar->count()) *bar += percent - bar->count();
        });
    std::cerr << "Wrote " << out.string() << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
