#include <algorithm> // transform
#include <boost/filesystem.hpp>
#include <cctype>
#include <memory>
#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
}

#include "media_probe.hpp"

namespace {

struct FormatContextCloser {
  void operator()(AVFormatContext *ctx) const { avformat_close_input(&ctx); }
};
using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextCloser>;

std::string av_error_string(int code) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(code, buf, sizeof(buf));
  return buf;
}

// Decoder name when one is registered ("h264", "aac"), else the codec id name.
std::string codec_name(AVCodecID id) {
  const AVCodec *codec = avcodec_find_decoder(id);
  std::string name = (codec && codec->name) ? codec->name : avcodec_get_name(id);
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return name;
}

std::string profile_name(const AVCodecParameters *par) {
  const char *name = avcodec_profile_name(par->codec_id, par->profile);
  return name ? name : "None";
}

const AVStream *first_stream(const AVFormatContext *ctx, AVMediaType type) {
  for (unsigned i = 0; i < ctx->nb_streams; i++) {
    if (ctx->streams[i]->codecpar->codec_type == type) return ctx->streams[i];
  }
  return nullptr;
}

} // namespace

MediaInfo probe_media(const std::string &path) {
  AVFormatContext *raw = nullptr;
  int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    throw MediaError("could not open '" + path + "': " + av_error_string(ret));
  }
  FormatContextPtr ctx(raw);

  ret = avformat_find_stream_info(ctx.get(), nullptr);
  if (ret < 0) {
    throw MediaError("could not read stream info of '" + path +
                     "': " + av_error_string(ret));
  }

  const AVStream *video = first_stream(ctx.get(), AVMEDIA_TYPE_VIDEO);
  if (!video) throw MissingStreamError("'" + path + "' has no video stream");
  const AVStream *audio = first_stream(ctx.get(), AVMEDIA_TYPE_AUDIO);
  if (!audio) throw MissingStreamError("'" + path + "' has no audio stream");

  MediaInfo info;
  info.path = path;

  int64_t size = ctx->pb ? avio_size(ctx->pb) : -1;
  info.size_bytes = size >= 0
      ? size
      : static_cast<int64_t>(boost::filesystem::file_size(path));
  info.duration_us = ctx->duration == AV_NOPTS_VALUE ? 0 : ctx->duration;

  const AVCodecParameters *vpar = video->codecpar;
  info.video.width    = vpar->width;
  info.video.height   = vpar->height;
  info.video.rate_num = video->avg_frame_rate.num;
  info.video.rate_den = video->avg_frame_rate.den;
  info.video.codec    = codec_name(vpar->codec_id);
  info.video.profile  = profile_name(vpar);
  info.video.bit_rate = vpar->bit_rate;
  info.video.frames   = video->nb_frames;

  if (info.video.width <= 0 || info.video.height <= 0) {
    throw MediaError("'" + path + "' has a video stream without dimensions");
  }
  if (info.video.rate_num <= 0 || info.video.rate_den <= 0) {
    throw MediaError("'" + path + "' has no average video frame rate");
  }

  const AVCodecParameters *apar = audio->codecpar;
  info.audio.codec       = codec_name(apar->codec_id);
  info.audio.profile     = profile_name(apar);
  info.audio.bit_rate    = apar->bit_rate;
  info.audio.sample_rate = apar->sample_rate;
  info.audio.channels    = apar->ch_layout.nb_channels;

  const AVDictionaryEntry *lang = av_dict_get(audio->metadata, "language", nullptr, 0);
  if (lang && lang->value) info.audio.language = lang->value;

  return info;
}

VideoFrameSource::VideoFrameSource(const std::string &path)
    : path_(path), capture_(path) {
  if (!capture_.isOpened()) {
    throw MediaError("error opening video stream or file '" + path + "'");
  }
  // frames must keep the coded size probe_media reports, which the cells
  // are sized from; a rotated frame would be squashed into the cell
  capture_.set(cv::CAP_PROP_ORIENTATION_AUTO, 0);
}

cv::Mat VideoFrameSource::grab(int64_t timestamp_us) {
  capture_.set(cv::CAP_PROP_POS_MSEC, timestamp_us / 1000.0);

  cv::Mat frame;
  if (!capture_.read(frame) || frame.empty()) {
    throw MediaError("could not decode a frame of '" + path_ + "' at " +
                     std::to_string(timestamp_us) + " us");
  }
  return frame;
}
