#include "flashdrop/http/preview_page.h"

#include <sstream>

#include <Poco/DateTimeFormatter.h>

namespace flashdrop::http {

namespace {

const char* kStyle = R"(
        :root { --accent: #3b82f6; --bg: #0f172a; --card: #1e293b; --text: #f8fafc; --muted: #94a3b8; }
        * { margin: 0; padding: 0; box-sizing: border-box; }
        body { background: var(--bg); color: var(--text); font-family: system-ui, sans-serif;
               min-height: 100vh; padding: 1.5rem; }
        .container { max-width: 1024px; margin: 0 auto; display: flex; flex-direction: column; gap: 1.5rem; }
        .card { background: var(--card); border-radius: 0.75rem; padding: 1.5rem; }
        .header { display: flex; align-items: center; justify-content: space-between; gap: 1rem; }
        .header h1 { font-size: 1.25rem; overflow: hidden; text-overflow: ellipsis; white-space: nowrap; }
        .button { padding: 0.5rem 1rem; background: var(--accent); color: white; text-decoration: none;
                  border-radius: 0.5rem; font-size: 0.875rem; }
        .preview { display: flex; align-items: center; justify-content: center; min-height: 400px; }
        .preview-content { max-width: 100%; max-height: 70vh; object-fit: contain; border-radius: 0.5rem; }
        .no-preview { color: var(--muted); text-align: center; }
        .metadata { display: grid; grid-template-columns: repeat(auto-fit, minmax(250px, 1fr)); gap: 1rem; }
        .label { color: var(--muted); font-size: 0.875rem; display: block; }
)";

bool StartsWith(const std::string& value, const char* prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::string PreviewBody(const metadata::FileRecord& record, const std::string& raw_url) {
    const auto name = EscapeHtml(record.original_name);
    if (StartsWith(record.mime_type, "image/")) {
        return "<img src=\"" + raw_url + "\" alt=\"" + name +
               "\" class=\"preview-content\" loading=\"lazy\" />";
    }
    if (StartsWith(record.mime_type, "video/")) {
        return "<video class=\"preview-content\" controls><source src=\"" + raw_url +
               "\" type=\"" + EscapeHtml(record.mime_type) +
               "\">Your browser does not support the video tag.</video>";
    }
    return "<div class=\"no-preview\"><p>No preview available for this file type</p>"
           "<p>Use the download button above to access the file</p></div>";
}

}  // namespace

std::string EscapeHtml(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&#39;";
                break;
            default:
                out += ch;
                break;
        }
    }
    return out;
}

std::string RenderPreviewPage(const metadata::FileRecord& record, const core::SiteConfig& site) {
    const auto raw_url = "/files/" + record.id + record.extension + "?raw=true";
    const auto absolute_raw_url = site.public_url + raw_url;
    const auto name = EscapeHtml(record.original_name);
    const auto site_name = EscapeHtml(site.name);
    const auto uploaded = Poco::DateTimeFormatter::format(record.upload_time, "%Y-%m-%d %H:%M");

    std::ostringstream html;
    html << "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n"
         << "    <meta charset=\"UTF-8\">\n"
         << "    <meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n"
         << "    <title>" << name << " - " << site_name << "</title>\n"
         << "    <meta property=\"og:title\" content=\"" << name << " - " << site_name << "\" />\n"
         << "    <meta property=\"og:description\" content=\"File: " << name
         << "&#10;Size: " << EscapeHtml(record.human_size) << "&#10;Uploaded: " << uploaded
         << "\" />\n";
    if (StartsWith(record.mime_type, "image/")) {
        html << "    <meta property=\"og:image\" content=\"" << EscapeHtml(absolute_raw_url)
             << "\" />\n";
    }
    html << "    <meta property=\"og:url\" content=\"" << EscapeHtml(absolute_raw_url) << "\" />\n"
         << "    <meta property=\"og:type\" content=\"website\" />\n"
         << "    <meta property=\"og:site_name\" content=\"" << site_name << "\" />\n"
         << "    <meta name=\"twitter:card\" content=\"summary_large_image\" />\n"
         << "    <style>" << kStyle << "    </style>\n"
         << "</head>\n<body>\n<div class=\"container\">\n"
         << "    <header class=\"card header\"><h1>" << name << "</h1>"
         << "<a href=\"" << raw_url << "&amp;download=true\" class=\"button\" download=\"" << name
         << "\">Download</a></header>\n"
         << "    <main class=\"card preview\">" << PreviewBody(record, raw_url) << "</main>\n"
         << "    <section class=\"card metadata\">\n"
         << "        <div><span class=\"label\">File Size</span>" << EscapeHtml(record.human_size)
         << "</div>\n"
         << "        <div><span class=\"label\">Upload Date</span>"
         << Poco::DateTimeFormatter::format(record.upload_time, "%d/%m/%Y") << "</div>\n"
         << "        <div><span class=\"label\">Expires</span>"
         << Poco::DateTimeFormatter::format(record.expiry_time, "%d/%m/%Y") << "</div>\n"
         << "    </section>\n</div>\n</body>\n</html>\n";
    return html.str();
}

}  // namespace flashdrop::http
