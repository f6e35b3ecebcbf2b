//
//  script_writer.hpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "identifier_codec.hpp"

namespace autovideo {

// Records an existing plugin offers as copy sources for new videos.
struct ScriptInfo {
    std::string esp_name;     ///< plugin receiving television/projector records
    std::string tv_record;    ///< editor id of the television record to duplicate
    std::string pr_record;    ///< editor id of the projector record to duplicate
    std::string di_esp_name;  ///< plugin receiving drive-in records
};

// Defaults matching the plugins this tool writes itself.
ScriptInfo default_script_info(const std::string &mod_name);

struct ScriptVideo {
    std::string token;         ///< 'X'-padded video identifier
    std::string display_name;  ///< name shown in game
    std::string audio_name;
    bool drive_in = false;     ///< fits the compact 8-grid family
};

// File name of the generated script, e.g. "VotW_MyMod_xEdit.pas".
std::string script_file_name(const std::string &mod_name);

// Render an xEdit (FO4Edit) script that appends one record set per video.
std::string render_xedit_script(const ModIdentifiers &mod, const ScriptInfo &info,
                                const std::vector<ScriptVideo> &videos);

}  // namespace autovideo
