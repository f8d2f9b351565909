#include "calling/alignment_source.h"
#include "calling/constants.h"
#include "calling/hts_alignment_source.h"
#include "calling/options.h"
#include "calling/vcf_writer.h"
#include "cli/cli.h"
#include "pipeline/batch_source.h"
#include "pipeline/calling_pipeline.h"
#include "pipeline/classifier_torch_script.h"
#include "pipeline/site_caller.h"
#include "torch_utils/torch_utils.h"
#include "utils/fai_utils.h"
#include "utils/log_utils.h"
#include "utils/timer_high_res.h"

#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace clarion {

namespace {

/// \brief All options for this tool.
struct Options {
    std::filesystem::path tensor_fn;
    std::filesystem::path chkpnt_fn;
    std::filesystem::path call_fn;
    std::filesystem::path bam_fn;
    std::filesystem::path ref_fn;
    int32_t threads = 0;
    int64_t batch_size = 10000;
    int32_t verbosity = 0;
    calling::CallerOptions caller;
};

void create_cli(argparse::ArgumentParser& parser, int& verbosity) {
    parser.add_description(
            "Call variants from the evidence tensors of candidate sites using a trained "
            "classifier.");

    parser.add_argument("--tensor_fn")
            .help("Tensor input, use PIPE for standard input.")
            .default_value(std::string{"PIPE"});
    parser.add_argument("--chkpnt_fn")
            .help("TorchScript checkpoint of the classifier.")
            .required();
    parser.add_argument("--call_fn")
            .help("Output VCF file. Written to stdout if not specified or '-'.")
            .default_value(std::string{"-"});
    parser.add_argument("--bam_fn")
            .help("Indexed BAM file, used to recover the bases of long indels.")
            .default_value(std::string{});
    parser.add_argument("--ref_fn")
            .help("Indexed reference FASTA. Contig lines of the VCF header are taken from its "
                  ".fai index.")
            .default_value(std::string{});
    parser.add_argument("--qual")
            .help("If set, variants with equal or higher quality are marked PASS, or LowQual "
                  "otherwise.")
            .scan<'i', int>();
    parser.add_argument("--sampleName")
            .help("Sample name shown in the VCF file.")
            .default_value(std::string{"SAMPLE"});
    parser.add_argument("--showRef").help("Show reference calls.").flag();
    parser.add_argument("--debug")
            .help("Write the probabilities of every site instead of variant records.")
            .flag();
    parser.add_argument("--threads")
            .help("Number of threads. One is reserved for decoding, the rest run the classifier "
                  "(0 = automatic).")
            .default_value(0)
            .scan<'i', int>();
    parser.add_argument("--batch_size")
            .help("Number of sites classified at once.")
            .default_value(10000)
            .scan<'i', int>();
    parser.add_argument("--pysam_for_all_indel_bases")
            .help("Always use the alignments for the bases of indels.")
            .flag();
    parser.add_argument("-v", "--verbose")
            .default_value(false)
            .implicit_value(true)
            .nargs(0)
            .action([&](const auto&) { ++verbosity; })
            .append();
}

Options set_options(const argparse::ArgumentParser& parser, const int verbosity) {
    Options opt;

    opt.tensor_fn = parser.get<std::string>("tensor_fn");
    opt.chkpnt_fn = parser.get<std::string>("chkpnt_fn");
    opt.call_fn = parser.get<std::string>("call_fn");
    opt.bam_fn = parser.get<std::string>("bam_fn");
    opt.ref_fn = parser.get<std::string>("ref_fn");
    opt.threads = parser.get<int>("threads");
    opt.batch_size = parser.get<int>("batch_size");
    opt.verbosity = verbosity;

    opt.caller.pass_min_qual = parser.present<int>("qual");
    opt.caller.sample_name = parser.get<std::string>("sampleName");
    opt.caller.show_reference = parser.get<bool>("showRef");
    opt.caller.debug = parser.get<bool>("debug");
    opt.caller.use_alignment_for_all_indels = parser.get<bool>("pysam_for_all_indel_bases");

    // Reading from a pipe leaves most cores to the upstream tensor generator.
    if (opt.threads <= 0) {
        opt.threads = (opt.tensor_fn == "PIPE")
                              ? 4
                              : static_cast<int32_t>(std::thread::hardware_concurrency());
    }

    return opt;
}

void validate_options(const Options& opt) {
    if (!std::filesystem::exists(opt.chkpnt_fn)) {
        throw std::runtime_error("Checkpoint does not exist: " + opt.chkpnt_fn.string());
    }
    if ((opt.tensor_fn != "PIPE") && !std::filesystem::exists(opt.tensor_fn)) {
        throw std::runtime_error("Tensor file does not exist: " + opt.tensor_fn.string());
    }
    if (!std::empty(opt.bam_fn) && !std::filesystem::exists(opt.bam_fn)) {
        throw std::runtime_error("BAM file does not exist: " + opt.bam_fn.string());
    }
    if (!std::empty(opt.ref_fn)) {
        if (!std::filesystem::exists(opt.ref_fn)) {
            throw std::runtime_error("Reference file does not exist: " + opt.ref_fn.string());
        }
        if (!utils::check_fai_exists(opt.ref_fn)) {
            throw std::runtime_error("Reference index does not exist: " +
                                     utils::get_fai_path(opt.ref_fn).string());
        }
    }
    if (opt.batch_size <= 0) {
        throw std::runtime_error("Batch size needs to be > 0. Given: " +
                                 std::to_string(opt.batch_size));
    }
    if (opt.caller.use_alignment_for_all_indels && std::empty(opt.bam_fn)) {
        spdlog::warn(
                "Option --pysam_for_all_indel_bases was set without a BAM file. Indels will be "
                "skipped.");
    }
}

void run_calling(const Options& opt) {
    // One thread decodes, the rest are given to the classifier.
    utils::set_torch_num_threads(std::max(1, opt.threads - 1));

    pipeline::ClassifierTorchScript classifier(opt.chkpnt_fn);

    std::unique_ptr<calling::AlignmentSource> source;
    if (std::empty(opt.bam_fn) && std::empty(opt.ref_fn)) {
        source = std::make_unique<calling::EmptyAlignmentSource>();
    } else {
        source = std::make_unique<calling::HtsAlignmentSource>(opt.bam_fn, opt.ref_fn,
                                                               calling::PILEUP_MAX_DEPTH);
    }

    const std::vector<std::pair<std::string, int64_t>> contigs =
            std::empty(opt.ref_fn) ? std::vector<std::pair<std::string, int64_t>>{}
                                   : utils::load_seq_lengths(opt.ref_fn);

    std::ofstream ofs;
    const bool to_stdout = std::empty(opt.call_fn) || (opt.call_fn == "-");
    if (!to_stdout) {
        ofs.open(opt.call_fn);
        if (!ofs.is_open()) {
            throw std::runtime_error("Could not open file for writing: " + opt.call_fn.string());
        }
    }
    std::ostream& os = to_stdout ? std::cout : ofs;

    calling::VcfWriter writer(os, contigs, opt.caller.sample_name);
    pipeline::SiteCaller site_caller(writer, *source, opt.caller);
    pipeline::TensorTextBatchSource batch_source(opt.tensor_fn, opt.batch_size);

    int64_t batch_id = 0;
    pipeline::CallingPipeline calling_pipeline(
            classifier, batch_source,
            [&site_caller, &batch_id](const pipeline::InputBatch& batch,
                                      const pipeline::ClassifierOutput& output) {
                const pipeline::SiteCallerStats stats = site_caller.call_batch(batch, output);
                spdlog::debug("Batch {}: {} sites, {} records, {} skipped.", batch_id,
                              stats.num_sites, stats.num_records, stats.num_skipped);
                ++batch_id;
            });

    spdlog::info("Calling variants ...");
    const timer::TimerHighRes timer;

    const pipeline::PipelineStats stats = calling_pipeline.run();
    writer.flush();

    const pipeline::SiteCallerStats& totals = site_caller.total_stats();
    spdlog::info("Processed {} sites in {} batches, wrote {} records.", stats.num_sites,
                 stats.num_batches, totals.num_records);
    spdlog::info("Total time elapsed: {:.2f} s", timer.GetElapsedSeconds());
}

}  // namespace

int call_variants(int argc, char* argv[]) {
    try {
        argparse::ArgumentParser parser("clarion", CLARION_VERSION,
                                        argparse::default_arguments::help);
        int verbosity = 0;
        create_cli(parser, verbosity);

        try {
            parser.parse_args(argc, argv);
        } catch (const std::exception& e) {
            std::ostringstream parser_stream;
            parser_stream << parser;
            spdlog::error("{}\n{}", e.what(), parser_stream.str());
            return EXIT_FAILURE;
        }

        const Options opt = set_options(parser, verbosity);

        if (opt.verbosity > 0) {
            utils::SetVerboseLogging(static_cast<utils::VerboseLogLevel>(opt.verbosity));
        }

        validate_options(opt);

        utils::initialise_torch();

        run_calling(opt);

    } catch (const std::exception& e) {
        spdlog::error("Caught exception: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

}  // namespace clarion
