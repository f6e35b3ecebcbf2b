//
//  script_writer.cpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "script_writer.hpp"

#include <sstream>

#include "autovideo_version.hpp"

namespace autovideo {

namespace {

// Pascal string literal: single quotes are doubled.
std::string pascal_quote(const std::string &s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

}  // namespace

ScriptInfo default_script_info(const std::string &mod_name) {
    ScriptInfo info;
    info.esp_name = "VotW_" + mod_name + ".esp";
    info.tv_record = "VotWTelevisionTemplate";
    info.pr_record = "VotWProjectorTemplate";
    info.di_esp_name = "VotW_" + mod_name + "_DriveIn.esp";
    return info;
}

std::string script_file_name(const std::string &mod_name) {
    return "VotW_" + mod_name + "_xEdit.pas";
}

std::string render_xedit_script(const ModIdentifiers &mod, const ScriptInfo &info,
                                const std::vector<ScriptVideo> &videos) {
    std::ostringstream s;
    s << "{\n"
      << "  Generated by AutoVideo " << AUTOVIDEO_VERSION_DISPLAY << " for mod " << mod.name
      << ".\n"
      << "  Appends " << videos.size() << " video record set(s) to " << info.esp_name;
    if (!info.di_esp_name.empty()) {
        s << " and " << info.di_esp_name;
    }
    s << ".\n}\n"
      << "unit AutoVideo;\n\n"
      << "const\n"
      << "  ModToken = " << pascal_quote(mod.slug) << ";\n"
      << "  EspName = " << pascal_quote(info.esp_name) << ";\n"
      << "  DriveInEspName = " << pascal_quote(info.di_esp_name) << ";\n"
      << "  TelevisionRecord = " << pascal_quote(info.tv_record) << ";\n"
      << "  ProjectorRecord = " << pascal_quote(info.pr_record) << ";\n\n"
      << "function FindPlugin(name: string): IInterface;\n"
      << "var\n"
      << "  i: integer;\n"
      << "begin\n"
      << "  Result := nil;\n"
      << "  for i := 0 to Pred(FileCount) do\n"
      << "    if SameText(GetFileName(FileByIndex(i)), name) then begin\n"
      << "      Result := FileByIndex(i);\n"
      << "      Exit;\n"
      << "    end;\n"
      << "end;\n\n"
      << "procedure CopyRecord(plugin: IInterface; source, token, display, sound: string);\n"
      << "var\n"
      << "  src, dst: IInterface;\n"
      << "begin\n"
      << "  src := MainRecordByEditorID(GroupBySignature(plugin, 'ACTI'), source);\n"
      << "  if not Assigned(src) then begin\n"
      << "    AddMessage('Missing record ' + source + ' in ' + GetFileName(plugin));\n"
      << "    Exit;\n"
      << "  end;\n"
      << "  dst := wbCopyElementToFile(src, plugin, True, True);\n"
      << "  SetElementEditValues(dst, 'EDID', 'VotW_' + ModToken + '_' + token);\n"
      << "  SetElementEditValues(dst, 'FULL', display);\n"
      << "  AddMessage('Added ' + display + ' (' + token + ', sound ' + sound + ')');\n"
      << "end;\n\n"
      << "procedure AddVideo(token, display, sound: string; driveIn: boolean);\n"
      << "var\n"
      << "  plugin: IInterface;\n"
      << "begin\n"
      << "  plugin := FindPlugin(EspName);\n"
      << "  if Assigned(plugin) then begin\n"
      << "    CopyRecord(plugin, TelevisionRecord, token, display, sound);\n"
      << "    CopyRecord(plugin, ProjectorRecord, token, display, sound);\n"
      << "  end else\n"
      << "    AddMessage('Plugin not loaded: ' + EspName);\n"
      << "  if driveIn then begin\n"
      << "    plugin := FindPlugin(DriveInEspName);\n"
      << "    if Assigned(plugin) then\n"
      << "      CopyRecord(plugin, TelevisionRecord, token, display, sound)\n"
      << "    else\n"
      << "      AddMessage('Plugin not loaded: ' + DriveInEspName);\n"
      << "  end;\n"
      << "end;\n\n"
      << "function Initialize: integer;\n"
      << "begin\n";
    for (const auto &v : videos) {
        s << "  AddVideo(" << pascal_quote(v.token) << ", " << pascal_quote(v.display_name)
          << ", " << pascal_quote(v.audio_name) << ", " << (v.drive_in ? "True" : "False")
          << ");\n";
    }
    s << "  Result := 0;\n"
      << "end;\n\n"
      << "end.\n";
    return s.str();
}

}  // namespace autovideo
