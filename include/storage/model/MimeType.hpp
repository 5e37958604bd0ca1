#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace sbs::storage::model {

enum class Mime : uint8_t {
    AAC, AbiWord, APNG, Archive, AVIF, AVI, AmazonKindle, BinaryData, BMP, BZip, BZip2,
    CDAudio, CShellScript, CSS, CSV, DOC, DOCX, EOT, EPUB, GZip, GIF, HTML, Icon, ICalendar,
    JAR, JPEG, JavaScript, JSON, JSONLD, MIDI, JavaScriptModule, MP3, MP4, MPEG, AppleInstaller,
    ODP, ODS, ODT, OggAudio, OggVideo, Ogg, OpusAudio, OTF, PNG, PDF, PHP, PPT, PPTX, RAR, RTF,
    ShellScript, SVG, TAR, TIFF, MPEGTransportStream, TTF, PlainText, Visio, WAV, WEBMAudio,
    WEBMVideo, WEBP, WOFF, WOFF2, XHTML, XLS, XLSX, XML, XUL, ZIP, ThreeGPP, ThreeGPP2, SevenZip
};

// Escape hatch for anything not listed above, e.g. "image/*".
struct CustomMime {
    std::string value;
};

using MimeType = std::variant<Mime, CustomMime>;

std::string_view to_string(Mime mime);
std::string to_string(const MimeType& mime);

// Every enumerator of Mime, in declaration order.
std::span<const Mime> allKnownMimes();

}
