#pragma once

#include <string>

#include "flashdrop/core/config.h"
#include "flashdrop/metadata/metadata_store.h"

namespace flashdrop::http {

/// @brief HTML page wrapping a stored file, with Open Graph tags for link unfurling.
std::string RenderPreviewPage(const metadata::FileRecord& record, const core::SiteConfig& site);

std::string EscapeHtml(const std::string& value);

}  // namespace flashdrop::http
