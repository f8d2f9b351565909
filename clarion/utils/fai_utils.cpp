#include "fai_utils.h"

#include <htslib/faidx.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace clarion::utils {

std::filesystem::path get_fai_path(const std::filesystem::path& in_fastx_fn) {
    char* idx_name = fai_path(in_fastx_fn.string().c_str());
    std::filesystem::path ret;
    if (idx_name) {
        ret = std::filesystem::path(idx_name);
    }
    hts_free(idx_name);
    return ret;
}

bool check_fai_exists(const std::filesystem::path& in_fastx_fn) {
    const std::filesystem::path idx_name = get_fai_path(in_fastx_fn);
    if (std::empty(idx_name)) {
        return false;
    }
    return std::filesystem::exists(idx_name);
}

std::vector<std::pair<std::string, int64_t>> load_seq_lengths(
        const std::filesystem::path& in_fastx_fn) {
    const std::filesystem::path fai_fn = get_fai_path(in_fastx_fn);

    std::ifstream ifs(fai_fn);
    if (!ifs.is_open()) {
        throw std::runtime_error{"Could not open the FAI index: '" + fai_fn.string() + "'!"};
    }

    spdlog::debug("Loading sequence lengths from: {}", fai_fn.string());

    std::vector<std::pair<std::string, int64_t>> ret;
    std::string line;
    while (std::getline(ifs, line)) {
        if (std::empty(line)) {
            continue;
        }
        std::string name;
        int64_t length = 0;
        std::istringstream iss(line);
        if (!(iss >> name >> length)) {
            throw std::runtime_error{"Malformed line in the FAI index '" + fai_fn.string() +
                                     "': " + line};
        }
        ret.emplace_back(std::move(name), length);
    }
    return ret;
}

}  // namespace clarion::utils
