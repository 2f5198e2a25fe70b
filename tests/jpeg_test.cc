#include "metasplice/byte_cursor.h"
#include "metasplice/jpeg.h"
#include "metasplice/jpeg_markers.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace metasplice {
namespace {

    static constexpr std::string_view kIccSig("ICC_PROFILE\0", 12);
    static constexpr std::string_view kExifSig("Exif\0\0", 6);

    static void append_text(std::vector<std::byte>* out, std::string_view s)
    {
        append_bytes(out, as_bytes(s));
    }


    static void append_marker(std::vector<std::byte>* out, uint8_t marker)
    {
        append_u8(out, 0xFF);
        append_u8(out, marker);
    }


    static void append_jpeg_segment(std::vector<std::byte>* out,
                                    uint8_t marker,
                                    std::span<const std::byte> payload)
    {
        append_marker(out, marker);
        append_u16be(out, static_cast<uint16_t>(payload.size() + 2));
        append_bytes(out, payload);
    }


    static std::vector<std::byte> icc_payload(uint8_t seq, uint8_t count,
                                              std::string_view data)
    {
        std::vector<std::byte> p;
        append_text(&p, kIccSig);
        append_u8(&p, seq);
        append_u8(&p, count);
        append_text(&p, data);
        return p;
    }


    static std::vector<std::byte> filled(size_t size, uint8_t seed)
    {
        std::vector<std::byte> out(size);
        for (size_t i = 0; i < size; ++i) {
            out[i] = std::byte { static_cast<uint8_t>(seed + i * 7) };
        }
        return out;
    }


    // SOI APP0 DQT SOF0 DHT SOS <entropy with stuffing and RST> EOI trailer
    static std::vector<std::byte> make_scan_jpeg()
    {
        std::vector<std::byte> j;
        append_marker(&j, jpeg_marker::kSoi);

        std::vector<std::byte> jfif;
        append_text(&jfif, std::string_view("JFIF\0", 5));
        append_u16be(&jfif, 0x0102);
        append_u8(&jfif, 0);
        append_u16be(&jfif, 1);
        append_u16be(&jfif, 1);
        append_u8(&jfif, 0);
        append_u8(&jfif, 0);
        append_jpeg_segment(&j, jpeg_marker::kApp0, jfif);

        append_jpeg_segment(&j, jpeg_marker::kDqt, filled(65, 1));
        append_jpeg_segment(&j, jpeg_marker::kSof0, filled(15, 2));
        append_jpeg_segment(&j, jpeg_marker::kDht, filled(20, 3));

        const std::vector<std::byte> sos = { std::byte { 0x01 },
                                             std::byte { 0x01 },
                                             std::byte { 0x00 },
                                             std::byte { 0x00 },
                                             std::byte { 0x3F },
                                             std::byte { 0x00 } };
        append_jpeg_segment(&j, jpeg_marker::kSos, sos);

        for (uint8_t b : { 0x12, 0xFF, 0x00, 0x34, 0xFF, 0xD0, 0x56 }) {
            append_u8(&j, b);
        }
        append_marker(&j, jpeg_marker::kEoi);
        append_text(&j, "tail");
        return j;
    }


    static SharedBytes wrap(std::vector<std::byte> v)
    {
        return SharedBytes::from_vector(std::move(v));
    }


    TEST(JpegMarkers, LengthAndNames)
    {
        EXPECT_TRUE(jpeg_marker_has_length(jpeg_marker::kSof0));
        EXPECT_TRUE(jpeg_marker_has_length(jpeg_marker::kDht));
        EXPECT_TRUE(jpeg_marker_has_length(jpeg_marker::kSos));
        EXPECT_TRUE(jpeg_marker_has_length(jpeg_marker::kApp15));
        EXPECT_TRUE(jpeg_marker_has_length(jpeg_marker::kJpg13));
        EXPECT_TRUE(jpeg_marker_has_length(jpeg_marker::kCom));
        EXPECT_FALSE(jpeg_marker_has_length(jpeg_marker::kRst0));
        EXPECT_FALSE(jpeg_marker_has_length(jpeg_marker::kRst7));
        EXPECT_FALSE(jpeg_marker_has_length(jpeg_marker::kSoi));
        EXPECT_FALSE(jpeg_marker_has_length(jpeg_marker::kEoi));
        EXPECT_FALSE(jpeg_marker_has_length(jpeg_marker::kTem));

        EXPECT_TRUE(jpeg_marker_has_entropy(jpeg_marker::kSos));
        EXPECT_FALSE(jpeg_marker_has_entropy(jpeg_marker::kSof0));

        EXPECT_STREQ(jpeg_marker_name(jpeg_marker::kApp1), "APP1");
        EXPECT_STREQ(jpeg_marker_name(jpeg_marker::kDht), "DHT");
        EXPECT_STREQ(jpeg_marker_name(0xD3), "RST3");
        EXPECT_STREQ(jpeg_marker_name(0x02), "RES");
    }


    TEST(Jpeg, MinimalStream)
    {
        const SharedBytes in = wrap({ std::byte { 0xFF }, std::byte { 0xD8 },
                                      std::byte { 0xFF }, std::byte { 0xD9 } });
        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(in, &jpeg), ImageStatus::Ok);
        EXPECT_TRUE(jpeg.segments().empty());
        EXPECT_EQ(jpeg.encoded_size(), 4U);
        EXPECT_EQ(encode_to_bytes(jpeg), in);
    }


    TEST(Jpeg, RoundTripWithScan)
    {
        const SharedBytes in = wrap(make_scan_jpeg());
        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(in, &jpeg), ImageStatus::Ok);
        ASSERT_EQ(jpeg.segments().size(), 5U);
        EXPECT_EQ(jpeg.segments()[0].marker(), jpeg_marker::kApp0);
        EXPECT_EQ(jpeg.segments()[3].marker(), jpeg_marker::kDht);

        const JpegSegment& sos = jpeg.segments()[4];
        EXPECT_EQ(sos.marker(), jpeg_marker::kSos);
        EXPECT_EQ(sos.contents().size(), 6U);
        ASSERT_TRUE(sos.has_entropy());
        EXPECT_EQ(sos.entropy().size(), 7U + 2U + 4U);

        EXPECT_EQ(jpeg.encoded_size(), in.size());
        EXPECT_EQ(encode_to_bytes(jpeg), in);
    }


    TEST(Jpeg, SegmentsAreZeroCopy)
    {
        const SharedBytes in = wrap(make_scan_jpeg());
        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(in, &jpeg), ImageStatus::Ok);
        const SharedBytes& app0 = jpeg.segments()[0].contents();
        EXPECT_EQ(app0.data(), in.data() + 6);
    }


    TEST(Jpeg, RestartMarkerHasNoLength)
    {
        std::vector<std::byte> j;
        append_marker(&j, jpeg_marker::kSoi);
        append_marker(&j, 0xD0);
        append_marker(&j, jpeg_marker::kEoi);
        const SharedBytes in = wrap(j);

        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(in, &jpeg), ImageStatus::Ok);
        ASSERT_EQ(jpeg.segments().size(), 1U);
        EXPECT_EQ(jpeg.segments()[0].marker(), 0xD0);
        EXPECT_TRUE(jpeg.segments()[0].contents().empty());
        EXPECT_EQ(encode_to_bytes(jpeg), in);
    }


    TEST(Jpeg, FillBytesAreDropped)
    {
        std::vector<std::byte> j;
        append_marker(&j, jpeg_marker::kSoi);
        append_u8(&j, 0xFF);
        append_u8(&j, 0xFF);
        append_jpeg_segment(&j, jpeg_marker::kCom, as_bytes("hi"));
        append_marker(&j, jpeg_marker::kEoi);

        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(wrap(j), &jpeg), ImageStatus::Ok);
        ASSERT_EQ(jpeg.segments().size(), 1U);
        EXPECT_EQ(jpeg.segments()[0].marker(), jpeg_marker::kCom);
        EXPECT_EQ(jpeg.encoded_size(), j.size() - 2U);
    }


    TEST(Jpeg, ParseErrors)
    {
        Jpeg jpeg;
        EXPECT_EQ(Jpeg::parse(wrap({ std::byte { 0xFF } }), &jpeg),
                  ImageStatus::Truncated);
        EXPECT_EQ(Jpeg::parse(wrap({ std::byte { 0x89 }, std::byte { 0x50 } }),
                              &jpeg),
                  ImageStatus::WrongSignature);

        std::vector<std::byte> junk;
        append_marker(&junk, jpeg_marker::kSoi);
        append_u8(&junk, 0x00);
        EXPECT_EQ(Jpeg::parse(wrap(junk), &jpeg), ImageStatus::Truncated);

        for (uint16_t bad_length : { 0, 1 }) {
            std::vector<std::byte> short_len;
            append_marker(&short_len, jpeg_marker::kSoi);
            append_marker(&short_len, jpeg_marker::kApp0);
            append_u16be(&short_len, bad_length);
            append_marker(&short_len, jpeg_marker::kEoi);
            EXPECT_EQ(Jpeg::parse(wrap(short_len), &jpeg),
                      ImageStatus::Truncated)
                << "length " << bad_length;
        }

        std::vector<std::byte> no_eoi;
        append_marker(&no_eoi, jpeg_marker::kSoi);
        append_jpeg_segment(&no_eoi, jpeg_marker::kCom, as_bytes("x"));
        EXPECT_EQ(Jpeg::parse(wrap(no_eoi), &jpeg), ImageStatus::Truncated);

        std::vector<std::byte> open_scan;
        append_marker(&open_scan, jpeg_marker::kSoi);
        append_jpeg_segment(&open_scan, jpeg_marker::kSos, filled(6, 9));
        append_u8(&open_scan, 0x11);
        append_u8(&open_scan, 0xFF);
        append_u8(&open_scan, 0x00);
        EXPECT_EQ(Jpeg::parse(wrap(open_scan), &jpeg), ImageStatus::Truncated);
    }


    TEST(Jpeg, LengthFitsChecksSegmentFraming)
    {
        const SharedBytes max_contents = SharedBytes::from_vector(
            std::vector<std::byte>(kJpegMaxContentsSize));
        const SharedBytes too_long = SharedBytes::from_vector(
            std::vector<std::byte>(kJpegMaxContentsSize + 1));
        EXPECT_TRUE(JpegSegment(jpeg_marker::kCom, max_contents).length_fits());
        EXPECT_FALSE(JpegSegment(jpeg_marker::kCom, too_long).length_fits());
        EXPECT_TRUE(JpegSegment(jpeg_marker::kRst0).length_fits());
        EXPECT_FALSE(JpegSegment(jpeg_marker::kRst0,
                                 SharedBytes::from_string("x"))
                         .length_fits());

        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(wrap(make_scan_jpeg()), &jpeg), ImageStatus::Ok);
        EXPECT_TRUE(jpeg.lengths_fit());
        jpeg.segments_mut().insert(jpeg.segments_mut().begin(),
                                   JpegSegment(jpeg_marker::kCom, too_long));
        EXPECT_FALSE(jpeg.lengths_fit());
    }


    TEST(Jpeg, StrayBytesBetweenSegmentsAreDropped)
    {
        std::vector<std::byte> j;
        append_marker(&j, jpeg_marker::kSoi);
        append_u8(&j, 0x00);
        append_u8(&j, 0x42);
        append_jpeg_segment(&j, jpeg_marker::kCom, as_bytes("x"));
        append_marker(&j, jpeg_marker::kEoi);

        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(wrap(j), &jpeg), ImageStatus::Ok);
        ASSERT_EQ(jpeg.segments().size(), 1U);
        EXPECT_EQ(jpeg.segments()[0].marker(), jpeg_marker::kCom);
        EXPECT_EQ(jpeg.encoded_size(), j.size() - 2U);
    }


    TEST(Jpeg, TruncationAtEveryOffset)
    {
        const std::vector<std::byte> full = make_scan_jpeg();
        for (size_t n = 0; n < full.size(); ++n) {
            const SharedBytes prefix = SharedBytes::copy_of(
                std::span<const std::byte>(full.data(), n));
            Jpeg jpeg;
            const ImageStatus status = Jpeg::parse(prefix, &jpeg);
            if (status == ImageStatus::Ok) {
                EXPECT_EQ(encode_to_bytes(jpeg), prefix) << "prefix " << n;
            }
        }
    }


    TEST(Jpeg, SegmentQueries)
    {
        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(wrap(make_scan_jpeg()), &jpeg), ImageStatus::Ok);
        const JpegSegment* dqt = jpeg.segment_by_marker(jpeg_marker::kDqt);
        ASSERT_NE(dqt, nullptr);
        EXPECT_EQ(dqt->contents().size(), 65U);
        EXPECT_EQ(jpeg.segment_by_marker(jpeg_marker::kCom), nullptr);
        EXPECT_EQ(jpeg.segments_by_marker(jpeg_marker::kSof0).size(), 1U);

        jpeg.remove_segments_by_marker(jpeg_marker::kDht);
        EXPECT_EQ(jpeg.segments().size(), 4U);
        EXPECT_EQ(jpeg.segment_by_marker(jpeg_marker::kDht), nullptr);
    }


    TEST(Jpeg, InsertedSegmentIsEncoded)
    {
        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(wrap(make_scan_jpeg()), &jpeg), ImageStatus::Ok);
        const uint64_t before = jpeg.encoded_size();
        jpeg.segments_mut().insert(jpeg.segments_mut().begin(),
                                   JpegSegment(jpeg_marker::kCom,
                                               SharedBytes::from_string("hi")));
        EXPECT_EQ(jpeg.encoded_size(), before + 6U);

        Jpeg again;
        ASSERT_EQ(Jpeg::parse(encode_to_bytes(jpeg), &again), ImageStatus::Ok);
        ASSERT_FALSE(again.segments().empty());
        EXPECT_EQ(again.segments().front().marker(), jpeg_marker::kCom);
        EXPECT_EQ(again.segments().front().contents(),
                  SharedBytes::from_string("hi"));
    }


    TEST(Jpeg, SegmentFragmentsSkipEmptyContents)
    {
        const JpegSegment seg(jpeg_marker::kSos, SharedBytes(),
                              SharedBytes::from_string("\x11\xFF\xD9"));
        EXPECT_EQ(seg.encoded_size(), 4U + 3U);

        FragmentSequence seq(seg);
        SharedBytes f;
        ASSERT_TRUE(seq.next(&f));
        EXPECT_EQ(f, SharedBytes::from_string(
                         std::string_view("\xFF\xDA\x00\x02", 4)));
        ASSERT_TRUE(seq.next(&f));
        EXPECT_EQ(f, SharedBytes::from_string("\x11\xFF\xD9"));
        EXPECT_FALSE(seq.next(&f));
    }


    TEST(Jpeg, IccReassemblyOutOfOrder)
    {
        std::vector<std::byte> j;
        append_marker(&j, jpeg_marker::kSoi);
        append_jpeg_segment(&j, jpeg_marker::kApp2, icc_payload(2, 3, "BB"));
        append_jpeg_segment(&j, jpeg_marker::kApp0, as_bytes("JFIF"));
        append_jpeg_segment(&j, jpeg_marker::kApp2, icc_payload(3, 3, "C"));
        append_jpeg_segment(&j, jpeg_marker::kApp2, icc_payload(1, 3, "AAA"));
        append_marker(&j, jpeg_marker::kEoi);

        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(wrap(j), &jpeg), ImageStatus::Ok);
        SharedBytes icc;
        ASSERT_TRUE(jpeg.icc_profile(&icc));
        EXPECT_EQ(icc, SharedBytes::from_string("AAABBC"));
    }


    TEST(Jpeg, SingleIccPartIsZeroCopy)
    {
        std::vector<std::byte> j;
        append_marker(&j, jpeg_marker::kSoi);
        append_jpeg_segment(&j, jpeg_marker::kApp2,
                            icc_payload(1, 1, "profile"));
        append_marker(&j, jpeg_marker::kEoi);
        const SharedBytes in = wrap(j);

        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(in, &jpeg), ImageStatus::Ok);
        SharedBytes icc;
        ASSERT_TRUE(jpeg.icc_profile(&icc));
        EXPECT_EQ(icc, SharedBytes::from_string("profile"));
        EXPECT_EQ(icc.data(), in.data() + 2 + 4 + kJpegIccHeaderSize);
    }


    TEST(Jpeg, InconsistentIccPartsAreRejected)
    {
        struct Part final {
            uint8_t seq;
            uint8_t count;
        };
        const std::vector<std::vector<Part>> cases = {
            { { 0, 1 } },
            { { 2, 1 } },
            { { 1, 2 }, { 1, 2 } },
            { { 1, 2 }, { 2, 3 } },
            { { 1, 3 }, { 2, 3 } },
        };
        for (const std::vector<Part>& parts : cases) {
            std::vector<std::byte> j;
            append_marker(&j, jpeg_marker::kSoi);
            for (const Part& p : parts) {
                append_jpeg_segment(&j, jpeg_marker::kApp2,
                                    icc_payload(p.seq, p.count, "x"));
            }
            append_marker(&j, jpeg_marker::kEoi);

            Jpeg jpeg;
            ASSERT_EQ(Jpeg::parse(wrap(j), &jpeg), ImageStatus::Ok);
            SharedBytes icc;
            EXPECT_FALSE(jpeg.icc_profile(&icc));
        }
    }


    TEST(Jpeg, ShortApp2IsNotAnIccPart)
    {
        std::vector<std::byte> j;
        append_marker(&j, jpeg_marker::kSoi);
        append_jpeg_segment(&j, jpeg_marker::kApp2, as_bytes(kIccSig));
        append_marker(&j, jpeg_marker::kEoi);

        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(wrap(j), &jpeg), ImageStatus::Ok);
        SharedBytes icc;
        EXPECT_FALSE(jpeg.icc_profile(&icc));
    }


    TEST(Jpeg, SetIccSplitsIntoOrderedParts)
    {
        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(wrap(make_scan_jpeg()), &jpeg), ImageStatus::Ok);

        const SharedBytes profile = wrap(
            filled(kJpegIccMaxChunkSize * 2 + 10, 5));
        ASSERT_EQ(jpeg.set_icc_profile(profile), ImageStatus::Ok);

        const std::vector<JpegSegment>& segs = jpeg.segments();
        ASSERT_EQ(segs.size(), 8U);
        for (size_t i = 0; i < 3; ++i) {
            const JpegSegment& s = segs[3 + i];
            EXPECT_EQ(s.marker(), jpeg_marker::kApp2);
            ASSERT_TRUE(s.contents().starts_with(kIccSig));
            EXPECT_EQ(static_cast<uint8_t>(s.contents()[12]), i + 1);
            EXPECT_EQ(static_cast<uint8_t>(s.contents()[13]), 3U);
        }
        EXPECT_EQ(segs[3].contents().size(),
                  kJpegIccHeaderSize + kJpegIccMaxChunkSize);
        EXPECT_EQ(segs[5].contents().size(), kJpegIccHeaderSize + 10U);

        SharedBytes icc;
        ASSERT_TRUE(jpeg.icc_profile(&icc));
        EXPECT_EQ(icc, profile);

        Jpeg again;
        ASSERT_EQ(Jpeg::parse(encode_to_bytes(jpeg), &again), ImageStatus::Ok);
        ASSERT_TRUE(again.icc_profile(&icc));
        EXPECT_EQ(icc, profile);
    }


    TEST(Jpeg, SetIccExactMultipleUsesNoEmptyPart)
    {
        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(wrap(make_scan_jpeg()), &jpeg), ImageStatus::Ok);
        const SharedBytes profile = wrap(filled(kJpegIccMaxChunkSize, 1));
        ASSERT_EQ(jpeg.set_icc_profile(profile), ImageStatus::Ok);
        EXPECT_EQ(jpeg.segments_by_marker(jpeg_marker::kApp2).size(), 1U);
    }


    TEST(Jpeg, SetIccTooLargeLeavesImageUntouched)
    {
        const SharedBytes in = wrap(make_scan_jpeg());
        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(in, &jpeg), ImageStatus::Ok);
        const SharedBytes profile = wrap(
            filled(kJpegIccMaxChunkSize * 255 + 1, 0));
        EXPECT_EQ(jpeg.set_icc_profile(profile), ImageStatus::LimitExceeded);
        EXPECT_EQ(encode_to_bytes(jpeg), in);
    }


    TEST(Jpeg, ReplacingIccWithSameBytesIsIdempotent)
    {
        std::vector<std::byte> j;
        append_marker(&j, jpeg_marker::kSoi);
        append_jpeg_segment(&j, jpeg_marker::kApp0, as_bytes("JFIF"));
        append_jpeg_segment(&j, jpeg_marker::kDqt, filled(65, 1));
        append_jpeg_segment(&j, jpeg_marker::kSof0, filled(15, 2));
        append_jpeg_segment(&j, jpeg_marker::kApp2, icc_payload(1, 1, "srgb"));
        append_jpeg_segment(&j, jpeg_marker::kDht, filled(20, 3));
        append_marker(&j, jpeg_marker::kEoi);
        const SharedBytes in = wrap(j);

        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(in, &jpeg), ImageStatus::Ok);
        SharedBytes icc;
        ASSERT_TRUE(jpeg.icc_profile(&icc));
        ASSERT_EQ(jpeg.set_icc_profile(icc), ImageStatus::Ok);
        EXPECT_EQ(encode_to_bytes(jpeg), in);
    }


    TEST(Jpeg, RemoveIcc)
    {
        std::vector<std::byte> j;
        append_marker(&j, jpeg_marker::kSoi);
        append_jpeg_segment(&j, jpeg_marker::kApp2, icc_payload(1, 1, "p"));
        append_jpeg_segment(&j, jpeg_marker::kApp2, as_bytes("MPF"));
        append_marker(&j, jpeg_marker::kEoi);

        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(wrap(j), &jpeg), ImageStatus::Ok);
        jpeg.remove_icc_profile();
        ASSERT_EQ(jpeg.segments().size(), 1U);
        EXPECT_TRUE(jpeg.segments()[0].contents().starts_with("MPF"));
        SharedBytes icc;
        EXPECT_FALSE(jpeg.icc_profile(&icc));
    }


    TEST(Jpeg, ExifSetGetRemove)
    {
        const SharedBytes in = wrap({ std::byte { 0xFF }, std::byte { 0xD8 },
                                      std::byte { 0xFF }, std::byte { 0xD9 } });
        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(in, &jpeg), ImageStatus::Ok);
        SharedBytes exif;
        EXPECT_FALSE(jpeg.exif(&exif));

        const SharedBytes tiff = SharedBytes::from_string(
            std::string_view("MM\0*\0\0\0\x08", 8));
        ASSERT_EQ(jpeg.set_exif(tiff), ImageStatus::Ok);
        ASSERT_EQ(jpeg.segments().size(), 1U);
        EXPECT_EQ(jpeg.segments()[0].marker(), jpeg_marker::kApp1);
        EXPECT_TRUE(jpeg.segments()[0].contents().starts_with(kExifSig));
        ASSERT_TRUE(jpeg.exif(&exif));
        EXPECT_EQ(exif, tiff);
        EXPECT_EQ(jpeg.encoded_size(), 4U + 4U + 6U + 8U);

        jpeg.remove_exif();
        EXPECT_EQ(encode_to_bytes(jpeg), in);
    }


    TEST(Jpeg, ExifTooLarge)
    {
        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(wrap(make_scan_jpeg()), &jpeg), ImageStatus::Ok);
        EXPECT_EQ(jpeg.set_exif(wrap(filled(kJpegExifMaxSize + 1, 0))),
                  ImageStatus::LimitExceeded);
        EXPECT_EQ(jpeg.set_exif(wrap(filled(kJpegExifMaxSize, 0))),
                  ImageStatus::Ok);
    }


    TEST(Jpeg, MetadataIsNeverInsertedAfterScan)
    {
        std::vector<std::byte> j;
        append_marker(&j, jpeg_marker::kSoi);
        append_jpeg_segment(&j, jpeg_marker::kSos, filled(6, 4));
        append_u8(&j, 0x42);
        append_marker(&j, jpeg_marker::kEoi);

        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(wrap(j), &jpeg), ImageStatus::Ok);
        ASSERT_EQ(jpeg.set_exif(SharedBytes::from_string("II*")),
                  ImageStatus::Ok);
        ASSERT_EQ(jpeg.segments().size(), 2U);
        EXPECT_EQ(jpeg.segments()[0].marker(), jpeg_marker::kApp1);
        EXPECT_EQ(jpeg.segments()[1].marker(), jpeg_marker::kSos);
    }


    TEST(Jpeg, CustomInsertionIndex)
    {
        Jpeg jpeg;
        ASSERT_EQ(Jpeg::parse(wrap(make_scan_jpeg()), &jpeg), ImageStatus::Ok);
        EditOptions options;
        options.jpeg_metadata_index = 1;
        ASSERT_EQ(jpeg.set_exif(SharedBytes::from_string("II*"), options),
                  ImageStatus::Ok);
        EXPECT_EQ(jpeg.segments()[1].marker(), jpeg_marker::kApp1);
    }

}  // namespace
}  // namespace metasplice
