#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "song_catalog/song_catalog.hpp"

namespace song_catalog {

void print_batch_usage(std::ostream& out);

// Runs one batch command against an already loaded catalog and returns the process
// exit status.
int run_batch(const std::vector<std::string>& args, SongCatalog& catalog, std::ostream& out, std::ostream& err);

} // namespace song_catalog
