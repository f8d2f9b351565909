#pragma once

#include <memory>

struct faidx_t;
struct hts_idx_t;
struct hts_itr_t;
struct htsFile;
struct sam_hdr_t;

namespace clarion {

struct SamHdrDestructor {
    void operator()(sam_hdr_t *);
};
using SamHdrPtr = std::unique_ptr<sam_hdr_t, SamHdrDestructor>;

struct HtsFileDestructor {
    void operator()(htsFile *);
};
using HtsFilePtr = std::unique_ptr<htsFile, HtsFileDestructor>;

struct HtsIdxDestructor {
    void operator()(hts_idx_t *);
};
using HtsIdxPtr = std::unique_ptr<hts_idx_t, HtsIdxDestructor>;

struct HtsItrDestructor {
    void operator()(hts_itr_t *);
};
using HtsItrPtr = std::unique_ptr<hts_itr_t, HtsItrDestructor>;

struct FaidxDestructor {
    void operator()(faidx_t *);
};
using FaidxPtr = std::unique_ptr<faidx_t, FaidxDestructor>;

}  // namespace clarion
