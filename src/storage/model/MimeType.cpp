#include "storage/model/MimeType.hpp"

#include <array>
#include <stdexcept>

namespace sbs::storage::model {

std::string_view to_string(const Mime mime) {
    switch (mime) {
        case Mime::AAC: return "audio/aac";
        case Mime::AbiWord: return "application/x-abiword";
        case Mime::APNG: return "image/apng";
        case Mime::Archive: return "application/x-freearc";
        case Mime::AVIF: return "image/avif";
        case Mime::AVI: return "video/x-msvideo";
        case Mime::AmazonKindle: return "application/vnd.amazon.ebook";
        case Mime::BinaryData: return "application/octet-stream";
        case Mime::BMP: return "image/bmp";
        case Mime::BZip: return "application/x-bzip";
        case Mime::BZip2: return "application/x-bzip2";
        case Mime::CDAudio: return "application/x-cdf";
        case Mime::CShellScript: return "application/x-csh";
        case Mime::CSS: return "text/css";
        case Mime::CSV: return "text/csv";
        case Mime::DOC: return "application/msword";
        case Mime::DOCX: return "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
        case Mime::EOT: return "application/vnd.ms-fontobject";
        case Mime::EPUB: return "application/epub+zip";
        case Mime::GZip: return "application/gzip";
        case Mime::GIF: return "image/gif";
        case Mime::HTML: return "text/html";
        case Mime::Icon: return "image/vnd.microsoft.icon";
        case Mime::ICalendar: return "text/calendar";
        case Mime::JAR: return "application/java-archive";
        case Mime::JPEG: return "image/jpeg";
        case Mime::JavaScript: return "text/javascript";
        case Mime::JSON: return "application/json";
        case Mime::JSONLD: return "application/ld+json";
        case Mime::MIDI: return "audio/midi";
        case Mime::JavaScriptModule: return "text/javascript";
        case Mime::MP3: return "audio/mpeg";
        case Mime::MP4: return "video/mp4";
        case Mime::MPEG: return "video/mpeg";
        case Mime::AppleInstaller: return "application/vnd.apple.installer+xml";
        case Mime::ODP: return "application/vnd.oasis.opendocument.presentation";
        case Mime::ODS: return "application/vnd.oasis.opendocument.spreadsheet";
        case Mime::ODT: return "application/vnd.oasis.opendocument.text";
        case Mime::OggAudio: return "audio/ogg";
        case Mime::OggVideo: return "video/ogg";
        case Mime::Ogg: return "application/ogg";
        case Mime::OpusAudio: return "audio/ogg";
        case Mime::OTF: return "font/otf";
        case Mime::PNG: return "image/png";
        case Mime::PDF: return "application/pdf";
        case Mime::PHP: return "application/x-httpd-php";
        case Mime::PPT: return "application/vnd.ms-powerpoint";
        case Mime::PPTX: return "application/vnd.openxmlformats-officedocument.presentationml.presentation";
        case Mime::RAR: return "application/vnd.rar";
        case Mime::RTF: return "application/rtf";
        case Mime::ShellScript: return "application/x-sh";
        case Mime::SVG: return "image/svg+xml";
        case Mime::TAR: return "application/x-tar";
        case Mime::TIFF: return "image/tiff";
        case Mime::MPEGTransportStream: return "video/mp2t";
        case Mime::TTF: return "font/ttf";
        case Mime::PlainText: return "text/plain";
        case Mime::Visio: return "application/vnd.visio";
        case Mime::WAV: return "audio/wav";
        case Mime::WEBMAudio: return "audio/webm";
        case Mime::WEBMVideo: return "video/webm";
        case Mime::WEBP: return "image/webp";
        case Mime::WOFF: return "font/woff";
        case Mime::WOFF2: return "font/woff2";
        case Mime::XHTML: return "application/xhtml+xml";
        case Mime::XLS: return "application/vnd.ms-excel";
        case Mime::XLSX: return "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
        case Mime::XML: return "application/xml";
        case Mime::XUL: return "application/vnd.mozilla.xul+xml";
        case Mime::ZIP: return "application/zip";
        case Mime::ThreeGPP: return "video/3gpp";
        case Mime::ThreeGPP2: return "video/3gpp2";
        case Mime::SevenZip: return "application/x-7z-compressed";
        default: throw std::invalid_argument("Unknown Mime enum value");
    }
}

std::string to_string(const MimeType& mime) {
    if (const auto* known = std::get_if<Mime>(&mime)) return std::string(to_string(*known));
    return std::get<CustomMime>(mime).value;
}

std::span<const Mime> allKnownMimes() {
    static constexpr std::array all = {
        Mime::AAC, Mime::AbiWord, Mime::APNG, Mime::Archive, Mime::AVIF, Mime::AVI,
        Mime::AmazonKindle, Mime::BinaryData, Mime::BMP, Mime::BZip, Mime::BZip2, Mime::CDAudio,
        Mime::CShellScript, Mime::CSS, Mime::CSV, Mime::DOC, Mime::DOCX, Mime::EOT, Mime::EPUB,
        Mime::GZip, Mime::GIF, Mime::HTML, Mime::Icon, Mime::ICalendar, Mime::JAR, Mime::JPEG,
        Mime::JavaScript, Mime::JSON, Mime::JSONLD, Mime::MIDI, Mime::JavaScriptModule, Mime::MP3,
        Mime::MP4, Mime::MPEG, Mime::AppleInstaller, Mime::ODP, Mime::ODS, Mime::ODT,
        Mime::OggAudio, Mime::OggVideo, Mime::Ogg, Mime::OpusAudio, Mime::OTF, Mime::PNG,
        Mime::PDF, Mime::PHP, Mime::PPT, Mime::PPTX, Mime::RAR, Mime::RTF, Mime::ShellScript,
        Mime::SVG, Mime::TAR, Mime::TIFF, Mime::MPEGTransportStream, Mime::TTF, Mime::PlainText,
        Mime::Visio, Mime::WAV, Mime::WEBMAudio, Mime::WEBMVideo, Mime::WEBP, Mime::WOFF,
        Mime::WOFF2, Mime::XHTML, Mime::XLS, Mime::XLSX, Mime::XML, Mime::XUL, Mime::ZIP,
        Mime::ThreeGPP, Mime::ThreeGPP2, Mime::SevenZip
    };
    return all;
}

}
