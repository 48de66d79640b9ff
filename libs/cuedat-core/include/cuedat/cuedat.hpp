#pragma once

/**
@file
@brief The entrypoint of the cuedat core library. Includes all cue sheet and catalogue functionality.
*/

#include <cuedat/version.hpp>

#include <cuedat/core/configuration.hpp>
#include <cuedat/core/hash.hpp>

#include <cuedat/media/cue/cue_generator.hpp>
#include <cuedat/media/cue/cue_parser.hpp>
#include <cuedat/media/cue/track_merger.hpp>
#include <cuedat/media/cue/track_splitter.hpp>
#include <cuedat/media/image_writer.hpp>

#include <cuedat/db/catalogue_matcher.hpp>
#include <cuedat/db/dat_loader.hpp>
#include <cuedat/db/dump_files.hpp>
#include <cuedat/db/dump_verifier.hpp>
