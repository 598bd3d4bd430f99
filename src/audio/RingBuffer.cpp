/**
 * RingBuffer.cpp - Explicit instantiations
 * The implementation lives in the header (template class).
 */

#include "parley/audio/RingBuffer.hpp"

namespace parley::audio {

template class RingBuffer<float>;
template class RingBuffer<int16_t>;

} // namespace parley::audio
