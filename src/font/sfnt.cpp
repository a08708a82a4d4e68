/*
 * sfnt.cpp — TrueType/OpenType subsetting via HarfBuzz
 *
 * Uses the HarfBuzz subset API (hb-subset.h) exclusively.
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sfnt.h"

#include <hb-subset.h>

#include <memory>

namespace sfnt {

namespace {

struct HbBlobDeleter {
    void operator()(hb_blob_t *b) const { if (b) hb_blob_destroy(b); }
};
struct HbFaceDeleter {
    void operator()(hb_face_t *f) const { if (f) hb_face_destroy(f); }
};
struct HbSubsetInputDeleter {
    void operator()(hb_subset_input_t *i) const { if (i) hb_subset_input_destroy(i); }
};

} // anonymous namespace

SubsetResult subsetFace(hb_face_t *face, const QSet<uint> &glyphIds)
{
    SubsetResult result;
    if (!face)
        return result;

    std::unique_ptr<hb_subset_input_t, HbSubsetInputDeleter> input(
        hb_subset_input_create_or_fail());
    if (!input)
        return result;

    hb_set_t *glyphSet = hb_subset_input_glyph_set(input.get());
    hb_set_add(glyphSet, 0);
    for (uint gid : glyphIds)
        hb_set_add(glyphSet, gid);

    uint32_t flags = static_cast<uint32_t>(hb_subset_input_get_flags(input.get()));
    flags |= HB_SUBSET_FLAGS_RETAIN_GIDS;
    flags |= HB_SUBSET_FLAGS_NAME_LEGACY;
    hb_subset_input_set_flags(input.get(), flags);

    std::unique_ptr<hb_face_t, HbFaceDeleter> subset(
        hb_subset_or_fail(face, input.get()));
    if (!subset)
        return result;

    std::unique_ptr<hb_blob_t, HbBlobDeleter> blob(hb_face_reference_blob(subset.get()));
    unsigned int length = 0;
    const char *data = blob ? hb_blob_get_data(blob.get(), &length) : nullptr;
    if (!data || length == 0)
        return result;

    result.fontData = QByteArray(data, static_cast<int>(length));
    result.success = true;
    return result;
}

} // namespace sfnt
