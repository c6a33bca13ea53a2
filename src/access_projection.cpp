#include "access_projection.hpp"

#include <algorithm>

std::set<std::string> managed_library_ids(const std::vector<Alternative>& alternatives) {
  std::set<std::string> out;
  for(const auto& alt : alternatives) {
    for(const auto& mirror : alt.mirrors) {
      out.insert(mirror.source_library_id);
      if(mirror.target_library_id) out.insert(*mirror.target_library_id);
    }
  }
  return out;
}

std::vector<std::string> project_library_access(const std::vector<Alternative>& alternatives,
                                                const std::optional<UserLanguageConfig>& user,
                                                const std::vector<std::string>& live_library_ids) {
  std::vector<std::string> out;
  if(!user || !user->plugin_managed) return out;

  const auto managed = managed_library_ids(alternatives);
  const std::set<std::string> live(live_library_ids.begin(), live_library_ids.end());

  const Alternative* selected = nullptr;
  if(user->selected_alternative_id) {
    auto it = std::find_if(alternatives.begin(), alternatives.end(),
                           [&](const Alternative& a){ return a.id == *user->selected_alternative_id; });
    if(it != alternatives.end()) selected = &*it;
  }

  std::set<std::string> own_targets;
  if(selected) {
    for(const auto& mirror : selected->mirrors) {
      if(mirror.target_library_id) own_targets.insert(*mirror.target_library_id);
    }
  }
  std::set<std::string> all_targets;
  for(const auto& alt : alternatives) {
    for(const auto& mirror : alt.mirrors) {
      if(mirror.target_library_id) all_targets.insert(*mirror.target_library_id);
    }
  }

  for(const auto& library_id : live_library_ids) {
    if(!managed.count(library_id)) continue;
    if(own_targets.count(library_id)) {
      out.push_back(library_id);
      continue;
    }
    if(all_targets.count(library_id)) continue;

    bool replaced_by_mirror = false;
    if(selected) {
      for(const auto& mirror : selected->mirrors) {
        if(mirror.source_library_id == library_id &&
           mirror.target_library_id && live.count(*mirror.target_library_id)) {
          replaced_by_mirror = true;
          break;
        }
      }
    }
    if(!replaced_by_mirror) out.push_back(library_id);
  }
  return out;
}
