#include "metasplice/jpeg_markers.h"

namespace metasplice {

bool
jpeg_marker_has_length(uint8_t marker) noexcept
{
    if (marker >= jpeg_marker::kSof0 && marker <= jpeg_marker::kSof15) {
        return true;
    }
    if (marker >= jpeg_marker::kSos && marker <= jpeg_marker::kExp) {
        return true;
    }
    if (marker >= jpeg_marker::kApp0 && marker <= jpeg_marker::kJpg13) {
        return true;
    }
    return marker == jpeg_marker::kCom;
}


bool
jpeg_marker_has_entropy(uint8_t marker) noexcept
{
    return marker == jpeg_marker::kSos;
}


const char*
jpeg_marker_name(uint8_t marker) noexcept
{
    static constexpr const char* kSofNames[16] = {
        "SOF0", "SOF1", "SOF2",  "SOF3",  "DHT",   "SOF5",  "SOF6",  "SOF7",
        "JPG",  "SOF9", "SOF10", "SOF11", "DAC",   "SOF13", "SOF14", "SOF15",
    };
    static constexpr const char* kRstNames[8] = {
        "RST0", "RST1", "RST2", "RST3", "RST4", "RST5", "RST6", "RST7",
    };
    static constexpr const char* kAppNames[16] = {
        "APP0", "APP1", "APP2",  "APP3",  "APP4",  "APP5",  "APP6",  "APP7",
        "APP8", "APP9", "APP10", "APP11", "APP12", "APP13", "APP14", "APP15",
    };
    static constexpr const char* kJpgNames[14] = {
        "JPG0", "JPG1", "JPG2", "JPG3",  "JPG4",  "JPG5",  "JPG6",
        "JPG7", "JPG8", "JPG9", "JPG10", "JPG11", "JPG12", "JPG13",
    };

    if (marker >= jpeg_marker::kSof0 && marker <= jpeg_marker::kSof15) {
        return kSofNames[marker - jpeg_marker::kSof0];
    }
    if (marker >= jpeg_marker::kRst0 && marker <= jpeg_marker::kRst7) {
        return kRstNames[marker - jpeg_marker::kRst0];
    }
    if (marker >= jpeg_marker::kApp0 && marker <= jpeg_marker::kApp15) {
        return kAppNames[marker - jpeg_marker::kApp0];
    }
    if (marker >= jpeg_marker::kJpg0 && marker <= jpeg_marker::kJpg13) {
        return kJpgNames[marker - jpeg_marker::kJpg0];
    }

    switch (marker) {
    case jpeg_marker::kTem: return "TEM";
    case jpeg_marker::kSoi: return "SOI";
    case jpeg_marker::kEoi: return "EOI";
    case jpeg_marker::kSos: return "SOS";
    case jpeg_marker::kDqt: return "DQT";
    case jpeg_marker::kDnl: return "DNL";
    case jpeg_marker::kDri: return "DRI";
    case jpeg_marker::kDhp: return "DHP";
    case jpeg_marker::kExp: return "EXP";
    case jpeg_marker::kCom: return "COM";
    default: return "RES";
    }
}

}  // namespace metasplice
