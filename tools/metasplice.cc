#include "metasplice/build_info.h"
#include "metasplice/byte_cursor.h"
#include "metasplice/dyn_image.h"
#include "metasplice/file_bytes.h"
#include "metasplice/image_options.h"
#include "metasplice/jpeg_markers.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace metasplice {
namespace {

    static constexpr uint64_t kDefaultMaxFileBytes = 1024ULL * 1024ULL
                                                     * 1024ULL;

    struct ToolOptions final {
        uint64_t max_file_bytes = kDefaultMaxFileBytes;
        ImageOptions image;
    };

    static const char* webp_kind_name(WebpKind kind) noexcept
    {
        switch (kind) {
        case WebpKind::Lossy: return "lossy";
        case WebpKind::Lossless: return "lossless";
        case WebpKind::Extended: return "extended";
        }
        return "unknown";
    }

    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }

    static bool load_image(const char* path, const ToolOptions& options,
                           DynImage* out)
    {
        SharedBytes bytes;
        ImageStatus status = map_file(path, options.max_file_bytes, &bytes);
        if (status != ImageStatus::Ok) {
            std::fprintf(stderr, "metasplice: failed to read `%s` (%s)\n",
                         path, status_name(status));
            return false;
        }
        status = DynImage::parse(bytes, out, options.image.limits);
        if (status != ImageStatus::Ok) {
            std::fprintf(stderr, "metasplice: failed to parse `%s` (%s)\n",
                         path, status_name(status));
            return false;
        }
        if (out->empty()) {
            std::fprintf(stderr, "metasplice: `%s`: unrecognized format\n",
                         path);
            return false;
        }
        return true;
    }

    static bool write_bytes(const char* path, const SharedBytes& bytes)
    {
        std::FILE* file = std::fopen(path, "wb");
        if (!file) {
            std::fprintf(stderr, "metasplice: cannot create `%s`\n", path);
            return false;
        }
        FileSink sink(file);
        const bool ok     = sink.write(bytes.span());
        const bool closed = std::fclose(file) == 0;
        if (!ok || !closed) {
            std::fprintf(stderr, "metasplice: failed to write `%s`\n", path);
            return false;
        }
        return true;
    }

    static bool save_image(const char* src_path, const char* path,
                           const DynImage& image)
    {
        // The image still references the mapped input; rewriting that file
        // in place would truncate the mapping under us.
        if (same_file(src_path, path)) {
            return write_bytes(path, encode_to_bytes(image));
        }
        const ImageStatus status = write_file(path, image);
        if (status != ImageStatus::Ok) {
            std::fprintf(stderr, "metasplice: failed to write `%s` (%s)\n",
                         path, status_name(status));
            return false;
        }
        return true;
    }

    static void print_jpeg(const Jpeg& jpeg)
    {
        const std::vector<JpegSegment>& segments = jpeg.segments();
        for (size_t i = 0; i < segments.size(); ++i) {
            const JpegSegment& seg = segments[i];
            std::printf("segment[%zu] marker=0x%02X name=%s size=%llu",
                        i, static_cast<unsigned>(seg.marker()),
                        jpeg_marker_name(seg.marker()),
                        static_cast<unsigned long long>(
                            seg.header_and_contents_size()));
            if (seg.has_entropy()) {
                std::printf(" entropy=%zu", seg.entropy().size());
            }
            std::putchar('\n');
        }
    }

    static void print_png(const Png& png)
    {
        const std::vector<PngChunk>& chunks = png.chunks();
        char tag[5];
        for (size_t i = 0; i < chunks.size(); ++i) {
            fourcc_to_chars(chunks[i].kind(), tag);
            std::printf("chunk[%zu] kind=%s size=%zu crc=0x%08X\n", i, tag,
                        chunks[i].contents().size(),
                        static_cast<unsigned>(chunks[i].crc()));
        }
    }

    static void print_riff(const RiffChunk& chunk, uint32_t depth)
    {
        char tag[5];
        fourcc_to_chars(chunk.id(), tag);
        std::printf("%*schunk id=%s size=%llu", static_cast<int>(depth * 2),
                    "", tag,
                    static_cast<unsigned long long>(chunk.content_length()));
        const RiffList* list = chunk.list();
        if (!list) {
            std::putchar('\n');
            return;
        }
        if (list->kind) {
            fourcc_to_chars(*list->kind, tag);
            std::printf(" kind=%s", tag);
        }
        std::putchar('\n');
        for (const RiffChunk& child : list->subchunks) {
            print_riff(child, depth + 1);
        }
    }

    static void print_webp(const WebP& webp)
    {
        std::printf("webp=%s", webp_kind_name(webp.kind()));
        WebpDimensions dims;
        if (webp.dimensions(&dims)) {
            std::printf(" width=%u height=%u", dims.width, dims.height);
        }
        uint8_t flags = 0;
        if (webp.extended_flags(&flags)) {
            std::printf(" flags=0x%02X", static_cast<unsigned>(flags));
        }
        std::putchar('\n');
        print_riff(webp.riff(), 0);
    }

    static int cmd_list(const char* path, const ToolOptions& options)
    {
        DynImage image;
        if (!load_image(path, options, &image)) {
            return 1;
        }

        std::printf("== %s\n", path);
        std::printf("format=%s size=%llu\n", format_name(image.format()),
                    static_cast<unsigned long long>(image.encoded_size()));
        if (const Jpeg* jpeg = image.jpeg()) {
            print_jpeg(*jpeg);
        } else if (const Png* png = image.png()) {
            print_png(*png);
        } else if (const WebP* webp = image.webp()) {
            print_webp(*webp);
        }

        SharedBytes blob;
        if (image.icc_profile(&blob)) {
            std::printf("icc=%zu\n", blob.size());
        } else {
            std::printf("icc=none\n");
        }
        if (image.exif(&blob)) {
            std::printf("exif=%zu\n", blob.size());
        } else {
            std::printf("exif=none\n");
        }
        return 0;
    }

    static int cmd_get(const char* path, const char* out_path, bool icc,
                       const ToolOptions& options)
    {
        DynImage image;
        if (!load_image(path, options, &image)) {
            return 1;
        }
        SharedBytes blob;
        const bool found = icc ? image.icc_profile(&blob) : image.exif(&blob);
        if (!found) {
            std::fprintf(stderr, "metasplice: `%s` has no %s\n", path,
                         icc ? "ICC profile" : "EXIF");
            return 1;
        }
        return write_bytes(out_path, blob) ? 0 : 1;
    }

    static int cmd_set(const char* path, const char* blob_path,
                       const char* out_path, bool icc,
                       const ToolOptions& options)
    {
        DynImage image;
        if (!load_image(path, options, &image)) {
            return 1;
        }
        SharedBytes blob;
        const ImageStatus read = map_file(blob_path, options.max_file_bytes,
                                          &blob);
        if (read != ImageStatus::Ok) {
            std::fprintf(stderr, "metasplice: failed to read `%s` (%s)\n",
                         blob_path, status_name(read));
            return 1;
        }

        const ImageStatus status
            = icc ? image.set_icc_profile(blob, options.image.edit)
                  : image.set_exif(blob, options.image.edit);
        if (status != ImageStatus::Ok) {
            std::fprintf(stderr, "metasplice: cannot embed %s into `%s` (%s)\n",
                         icc ? "ICC profile" : "EXIF", path,
                         status_name(status));
            return 1;
        }
        return save_image(path, out_path, image) ? 0 : 1;
    }

    static int cmd_strip(const char* path, const char* out_path,
                         const ToolOptions& options)
    {
        DynImage image;
        if (!load_image(path, options, &image)) {
            return 1;
        }
        ImageStatus status = image.remove_icc_profile();
        if (status == ImageStatus::Ok) {
            status = image.remove_exif();
        }
        if (status != ImageStatus::Ok) {
            std::fprintf(stderr, "metasplice: cannot strip `%s` (%s)\n", path,
                         status_name(status));
            return 1;
        }
        return save_image(path, out_path, image) ? 0 : 1;
    }

    static void print_version()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }

    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] <command> ...\n", argv0);
        std::printf("commands:\n");
        std::printf("  list <file>                     print the unit table\n");
        std::printf(
            "  get-icc <file> <out>            write the embedded ICC profile\n");
        std::printf(
            "  get-exif <file> <out>           write the embedded EXIF blob\n");
        std::printf(
            "  set-icc <file> <profile> <out>  embed a profile and write the image\n");
        std::printf(
            "  set-exif <file> <blob> <out>    embed an EXIF blob and write the image\n");
        std::printf(
            "  strip <file> <out>              remove ICC and EXIF and write the image\n");
        std::printf("options:\n");
        std::printf("  --version             print build information\n");
        std::printf(
            "  --max-file-bytes N    refuse larger inputs (default: 1 GiB, 0 = unlimited)\n");
        std::printf(
            "  --max-icc-bytes N     cap on inflated PNG profiles (default: 64 MiB)\n");
    }

}  // namespace
}  // namespace metasplice

int
main(int argc, char** argv)
{
    using namespace metasplice;

    ToolOptions options;

    int first_arg = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            return 0;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &options.max_file_bytes)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            i += 1;
            first_arg += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-icc-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1],
                               &options.image.limits.max_icc_bytes)) {
                std::fprintf(stderr, "invalid --max-icc-bytes value\n");
                return 2;
            }
            i += 1;
            first_arg += 2;
            continue;
        }
        break;
    }

    const int nargs = argc - first_arg;
    if (nargs < 1) {
        usage(argv[0]);
        return 2;
    }
    const char* cmd   = argv[first_arg];
    char** const args = argv + first_arg + 1;

    if (std::strcmp(cmd, "list") == 0 && nargs == 2) {
        return cmd_list(args[0], options);
    }
    if (std::strcmp(cmd, "get-icc") == 0 && nargs == 3) {
        return cmd_get(args[0], args[1], true, options);
    }
    if (std::strcmp(cmd, "get-exif") == 0 && nargs == 3) {
        return cmd_get(args[0], args[1], false, options);
    }
    if (std::strcmp(cmd, "set-icc") == 0 && nargs == 4) {
        return cmd_set(args[0], args[1], args[2], true, options);
    }
    if (std::strcmp(cmd, "set-exif") == 0 && nargs == 4) {
        return cmd_set(args[0], args[1], args[2], false, options);
    }
    if (std::strcmp(cmd, "strip") == 0 && nargs == 3) {
        return cmd_strip(args[0], args[1], options);
    }

    std::fprintf(stderr, "metasplice: unknown command or wrong arguments: %s\n",
                 cmd);
    usage(argv[0]);
    return 2;
}
