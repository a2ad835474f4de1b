#include "master/plugin/Registry.hpp"
#include "master/Errors.hpp"
#include <algorithm>

using namespace gridflow::master::plugin;

std::shared_ptr<IBackend> Registry::make_backend(const std::string& key, const KV& kv) const {
  auto it = backends_.find(key);
  if (it == backends_.end()) throw gridflow::BackendError("No backend factory for key: " + key);
  auto b = it->second(kv);
  if (!b) throw gridflow::BackendError("Backend factory returned null for key: " + key);
  return b;
}

std::vector<std::string> Registry::keys() const {
  std::vector<std::string> out;
  out.reserve(backends_.size());
  for (const auto& [k, f] : backends_) out.push_back(k);
  std::sort(out.begin(), out.end());
  return out;
}
