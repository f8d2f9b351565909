#pragma once

#include <ATen/ATen.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace clarion::pipeline {

/// A batch of candidate sites waiting to be classified.
struct InputBatch {
    // No batch follows this one.
    bool is_last = false;

    int64_t size = 0;

    // Float tensor of shape [size, WINDOW_LEN, NUM_NUCLEOTIDE_CHANNELS, NUM_EVIDENCE_CATEGORIES].
    at::Tensor evidence;

    // One "chromosome:position:referenceWindow" descriptor per site.
    std::vector<std::string> descriptors;
};

/**
 * \brief Pull-based producer of batches. A source is consumed once: the batch flagged with
 *          is_last is the final one and any further request throws.
 */
class BatchSource {
public:
    virtual ~BatchSource() = default;

    virtual InputBatch next_batch() = 0;
};

/**
 * \brief Reads the text tensor format, one site per line:
 *          "chromosome position referenceWindow v_0 v_1 ... v_1055"
 *          with the evidence values in [position][channel][category] order.
 *          Blank lines are ignored.
 */
class TensorTextBatchSource : public BatchSource {
public:
    /// Reads from a file, or from stdin if the path is "PIPE".
    TensorTextBatchSource(const std::filesystem::path& in_fn, int64_t batch_size);

    /// Reads from an already open stream, which must outlive the source.
    TensorTextBatchSource(std::istream& is, int64_t batch_size);

    InputBatch next_batch() override;

private:
    std::unique_ptr<std::ifstream> m_file;
    std::istream* m_is = nullptr;
    int64_t m_batch_size = 0;
    int64_t m_line_no = 0;
    bool m_finished = false;
};

/**
 * \brief Parses a single line of the text tensor format into its site descriptor and
 *          evidence values, which are written to `out`.
 *          Throws if the line does not have exactly the expected number of fields.
 */
std::string parse_tensor_line(const std::string& line, float* out);

}  // namespace clarion::pipeline
