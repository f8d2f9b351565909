#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace clarion::utils {

std::filesystem::path get_fai_path(const std::filesystem::path& in_fastx_fn);

bool check_fai_exists(const std::filesystem::path& in_fastx_fn);

/**
 * \brief Loads the (name, length) pairs of all sequences listed in the `.fai` index
 *          of the given FASTA file, in index order.
 */
std::vector<std::pair<std::string, int64_t>> load_seq_lengths(
        const std::filesystem::path& in_fastx_fn);

}  // namespace clarion::utils
