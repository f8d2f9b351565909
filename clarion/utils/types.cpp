#include "types.h"

#include <htslib/faidx.h>
#include <htslib/hts.h>
#include <htslib/sam.h>

namespace clarion {

void SamHdrDestructor::operator()(sam_hdr_t* hdr) { sam_hdr_destroy(hdr); }

void HtsFileDestructor::operator()(htsFile* hts_file) {
    if (hts_file) {
        hts_close(hts_file);
    }
}

void HtsIdxDestructor::operator()(hts_idx_t* idx) { hts_idx_destroy(idx); }

void HtsItrDestructor::operator()(hts_itr_t* itr) { hts_itr_destroy(itr); }

void FaidxDestructor::operator()(faidx_t* faidx) { fai_destroy(faidx); }

}  // namespace clarion
