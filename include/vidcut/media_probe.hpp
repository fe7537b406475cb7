/**
 * @file media_probe.hpp
 * @brief Source media inspection via libavformat
 *
 * @details Opens the container, reads stream info and fills a VideoSource:
 *          duration, container, video codec, dimensions, frame rate and
 *          whether an audio stream exists. Nothing is decoded.
 */

#ifndef VIDCUT_MEDIA_PROBE_HPP
#define VIDCUT_MEDIA_PROBE_HPP

#include <string>

#include "types.hpp"

namespace vidcut {

/**
 * @brief Inspect a media file.
 * @param path Input file
 * @param out Output: source description (path always set)
 * @param error Output: reason on failure
 * @return true if a video stream with a known duration was found
 */
bool probe_video_source(const std::string &path, VideoSource &out,
                        std::string &error);

} // namespace vidcut

#endif // VIDCUT_MEDIA_PROBE_HPP
