#pragma once

#include "lazyseq/generator.hpp"
#include "lazyseq/iterate.hpp"
#include "lazyseq/nested.hpp"
#include "lazyseq/pull_sequence.hpp"
#include "lazyseq/sequence.hpp"
#include "lazyseq/stages.hpp"
#include "lazyseq/stages/flatten.hpp"
#include "lazyseq/stages/materialize.hpp"
#include "lazyseq/stages/transform.hpp"
#include "lazyseq/text.hpp"
