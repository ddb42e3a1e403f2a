//
// Created by Giuseppe Francione on 09/03/26.
//

/**
 * @file remuxer.hpp
 * @brief Container conversion seam of the job executor.
 */

#ifndef TRAWL_REMUXER_HPP
#define TRAWL_REMUXER_HPP

#include <filesystem>
#include <stop_token>

namespace trawl {

/**
 * @brief Rewrites a media file into an MP4 container without re-encoding.
 */
class IRemuxer {
public:
    virtual ~IRemuxer() = default;

    /**
     * @brief Remuxes @p input into @p output.
     *
     * @p output may be partially written when this throws; the caller owns
     * its removal.
     *
     * @throws RemuxError if the input can't be demuxed or the output can't be written.
     * @throws OperationCancelled once @p st is stopped.
     */
    virtual void remux(const std::filesystem::path& input,
                       const std::filesystem::path& output,
                       const std::stop_token& st) = 0;
};

/**
 * @brief libavformat stream-copy remuxer.
 *
 * Audio and video streams are copied packet by packet; subtitle and data
 * streams that MP4 can't carry are dropped.
 */
class AvRemuxer final : public IRemuxer {
public:
    void remux(const std::filesystem::path& input,
               const std::filesystem::path& output,
               const std::stop_token& st) override;
};

} // namespace trawl

#endif // TRAWL_REMUXER_HPP
