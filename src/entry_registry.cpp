#include <lrp/entry_registry.hpp>

namespace lrp {

EntryRegistry::Applied EntryRegistry::apply(const Record& control) {
  const Control c = parse_control(control);

  if (const auto* sd = std::get_if<StartData>(&c)) {
    LogEntry e;
    e.id = sd->entry;
    e.name = sd->name;
    e.type_name = sd->type;
    e.type = value_type_from_name(sd->type);
    e.metadata = sd->metadata;
    entries_[sd->entry] = std::move(e);
    return Applied::Started;
  }
  if (const auto* fd = std::get_if<FinishData>(&c)) {
    entries_.erase(fd->entry);
    return Applied::Finished;
  }
  if (const auto* md = std::get_if<MetadataData>(&c)) {
    auto it = entries_.find(md->entry);
    if (it == entries_.end()) return Applied::Ignored;
    it->second.metadata = md->metadata;
    return Applied::MetadataSet;
  }
  return Applied::Ignored;
}

const LogEntry* EntryRegistry::resolve(std::uint32_t id) const {
  auto it = entries_.find(id);
  return it == entries_.end() ? nullptr : &it->second;
}

} // namespace lrp
