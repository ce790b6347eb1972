#include "jpeg_encode.h"
#include <turbojpeg.h>

bool encode_xrgb_to_jpeg(const uint32_t *px, int w, int h, int pitch, int quality, std::vector<uint8_t> &out_jpeg) {
    if (!px || w <= 0 || h <= 0) return false;

    tjhandle compressor = tj3Init(TJINIT_COMPRESS);
    if (!compressor) return false;

    tj3Set(compressor, TJPARAM_QUALITY, quality);
    // Small panels with thin lines and text; keep full chroma.
    tj3Set(compressor, TJPARAM_SUBSAMP, TJSAMP_444);

    unsigned char* dest_buf = nullptr;
    size_t dest_size = 0;

    int status = tj3Compress8(
        compressor,
        reinterpret_cast<const unsigned char*>(px),
        w, pitch, h,
        TJPF_BGRX,
        &dest_buf, &dest_size
    );

    if (status == 0) {
        out_jpeg.assign(dest_buf, dest_buf + dest_size);
    }

    tj3Free(dest_buf);
    tj3Destroy(compressor);
    return (status == 0);
}
