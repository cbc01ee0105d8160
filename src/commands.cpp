#include "docsync/commands.hpp"

#include <ostream>

#include "docsync/chain.hpp"
#include "docsync/errors.hpp"
#include "docsync/pack_codec.hpp"

namespace docsync {

int verify_command(const std::string& pack_path, std::ostream& out, std::ostream& err) {
  EvidencePack pack;
  try {
    pack = load_pack_file(pack_path);
  } catch (const IoError& e) {
    err << "FAILED: " << e.what() << "\n";
    return 1;
  } catch (const StructuralDecodeError& e) {
    err << "FAILED: " << e.what() << "\n";
    return 1;
  }

  const auto result = ChainBuilder::verify(pack);
  if (!result.ok) {
    err << "FAILED: " << result.reason << "\n";
    return 1;
  }
  out << "VERIFIED: " << result.reason << "\n";
  out << "  " << pack.results.size() << " claims, chain intact\n";
  return 0;
}

}  // namespace docsync
