/**
 * @file command_builder.hpp
 * @brief Renders a cut-list + encoding profile into an encoder invocation
 *
 * @details The builder is a pure function: no process is spawned and no file
 *          is touched. Identical inputs always render identical argument
 *          sequences, which lets the orchestrator log the exact command for
 *          replay.
 *
 *          Filter graph for N keep-segments (audio chains only when the
 *          source has audio):
 *
 *            [0:v]trim=start=S:end=E,setpts=PTS-STARTPTS[v0];
 *            [0:a]atrim=start=S:end=E,asetpts=PTS-STARTPTS[a0];
 *            ...
 *            [v0][a0]...[vN-1][aN-1]concat=n=N:v=1:a=1[v][a]
 */

#ifndef VIDCUT_COMMAND_BUILDER_HPP
#define VIDCUT_COMMAND_BUILDER_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace vidcut {

/**
 * @struct CommandSpec
 * @brief A fully rendered external tool invocation.
 */
struct CommandSpec {
  std::string program = "ffmpeg";
  std::vector<std::string> args; //< Arguments, program excluded
  std::string filter_graph;      //< The -filter_complex value

  /// program followed by args
  std::vector<std::string> argv() const;

  bool operator==(const CommandSpec &other) const {
    return program == other.program && args == other.args &&
           filter_graph == other.filter_graph;
  }
};

/**
 * @brief Build the encoder command for a job.
 *
 * @param source Probed input (path and audio presence are used)
 * @param cuts Keep-segments, rendered in order
 * @param profile Encoder parameters
 * @param output_path Artifact path
 * @throws ProfileIncompatibleError if the profile cannot be rendered for its
 *         encoder, or the cut-list is empty
 */
CommandSpec build_command(const VideoSource &source, const CutList &cuts,
                          const EncodingProfile &profile,
                          const std::string &output_path);

/**
 * @brief Trim/concat filter graph for a cut-list.
 */
std::string build_filter_graph(const CutList &cuts, bool with_audio);

/**
 * @brief Encoder-specific video arguments (-c:v, preset and rate-control).
 * @throws ProfileIncompatibleError
 */
std::vector<std::string> render_video_args(const EncodingProfile &profile);

/**
 * @brief Shell-quoted single-line rendering, for logs and replay.
 */
std::string render(const CommandSpec &spec);

} // namespace vidcut

#endif // VIDCUT_COMMAND_BUILDER_HPP
