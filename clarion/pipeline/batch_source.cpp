#include "batch_source.h"

#include "calling/constants.h"
#include "calling/site.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string_view>

namespace clarion::pipeline {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

}  // namespace

std::string parse_tensor_line(const std::string& line, float* out) {
    constexpr int64_t NUM_VALUES = calling::EvidenceTensor::NUM_VALUES;

    const char* ptr = line.c_str();
    const char* const end = ptr + std::size(line);

    const auto next_token = [&ptr, end]() {
        while ((ptr < end) && std::isspace(static_cast<unsigned char>(*ptr))) {
            ++ptr;
        }
        const char* start = ptr;
        while ((ptr < end) && !std::isspace(static_cast<unsigned char>(*ptr))) {
            ++ptr;
        }
        return std::string_view(start, ptr - start);
    };

    const std::string_view chrom = next_token();
    const std::string_view pos = next_token();
    const std::string_view window = next_token();
    if (std::empty(chrom) || std::empty(pos) || std::empty(window)) {
        throw std::runtime_error("Tensor line is missing the site fields.");
    }

    for (int64_t i = 0; i < NUM_VALUES; ++i) {
        while ((ptr < end) && std::isspace(static_cast<unsigned char>(*ptr))) {
            ++ptr;
        }
        if (ptr == end) {
            throw std::runtime_error("Tensor line has " + std::to_string(i) +
                                     " evidence values, expected " + std::to_string(NUM_VALUES) +
                                     ".");
        }
        char* value_end = nullptr;
        errno = 0;
        const float value = std::strtof(ptr, &value_end);
        if ((value_end == ptr) || (errno == ERANGE) ||
            ((value_end < end) && !std::isspace(static_cast<unsigned char>(*value_end)))) {
            throw std::runtime_error("Invalid evidence value at index " + std::to_string(i) + ".");
        }
        out[i] = value;
        ptr = value_end;
    }

    if (!std::empty(next_token())) {
        throw std::runtime_error("Tensor line has more than " + std::to_string(NUM_VALUES) +
                                 " evidence values.");
    }

    std::string descriptor;
    descriptor.reserve(std::size(chrom) + std::size(pos) + std::size(window) + 2);
    descriptor.append(chrom).append(":").append(pos).append(":").append(window);

    return descriptor;
}

TensorTextBatchSource::TensorTextBatchSource(const std::filesystem::path& in_fn,
                                             const int64_t batch_size)
        : m_batch_size{batch_size} {
    if (m_batch_size <= 0) {
        throw std::runtime_error("Batch size needs to be > 0. Given: " +
                                 std::to_string(m_batch_size));
    }
    if (in_fn == "PIPE") {
        m_is = &std::cin;
    } else {
        m_file = std::make_unique<std::ifstream>(in_fn);
        if (!m_file->is_open()) {
            throw std::runtime_error("Could not open tensor file: " + in_fn.string());
        }
        m_is = m_file.get();
    }
}

TensorTextBatchSource::TensorTextBatchSource(std::istream& is, const int64_t batch_size)
        : m_is{&is}, m_batch_size{batch_size} {
    if (m_batch_size <= 0) {
        throw std::runtime_error("Batch size needs to be > 0. Given: " +
                                 std::to_string(m_batch_size));
    }
}

InputBatch TensorTextBatchSource::next_batch() {
    if (m_finished) {
        throw std::runtime_error("The tensor input has already been consumed.");
    }

    constexpr int64_t NUM_VALUES = calling::EvidenceTensor::NUM_VALUES;

    InputBatch ret;
    std::vector<float> values;
    values.reserve(m_batch_size * NUM_VALUES);

    std::string line;
    while ((ret.size < m_batch_size) && std::getline(*m_is, line)) {
        ++m_line_no;
        if (is_blank(line)) {
            continue;
        }
        values.resize((ret.size + 1) * NUM_VALUES);
        try {
            ret.descriptors.emplace_back(
                    parse_tensor_line(line, std::data(values) + ret.size * NUM_VALUES));
        } catch (const std::exception& e) {
            throw std::runtime_error("Malformed tensor input at line " +
                                     std::to_string(m_line_no) + ": " + e.what());
        }
        ++ret.size;
    }

    if (m_is->bad()) {
        throw std::runtime_error("Failed reading the tensor input.");
    }

    ret.is_last = (ret.size < m_batch_size) || (m_is->peek() == std::char_traits<char>::eof());
    m_finished = ret.is_last;

    ret.evidence = at::empty({ret.size, calling::WINDOW_LEN, calling::NUM_NUCLEOTIDE_CHANNELS,
                              calling::NUM_EVIDENCE_CATEGORIES},
                             at::kFloat);
    if (ret.size > 0) {
        std::copy(std::cbegin(values), std::cend(values), ret.evidence.data_ptr<float>());
    }

    spdlog::debug("[TensorTextBatchSource] Loaded a batch of {} sites. is_last = {}", ret.size,
                  ret.is_last);

    return ret;
}

}  // namespace clarion::pipeline
