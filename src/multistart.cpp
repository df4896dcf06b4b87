///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "multistart.hpp"


///////////////////////////
///     MULTI-START     ///
///////////////////////////
int attemptsForRank(int totalAttempts, int rank, int size) {
    int base = totalAttempts / size;
    int extra = totalAttempts % size;
    return base + (rank < extra ? 1 : 0);
}

void serializePlacements(const std::vector<Placement>& placements, std::vector<int>& buffer) {
    buffer.clear();
    buffer.reserve(4 * placements.size());
    for (const Placement& p : placements) {
        buffer.push_back(p.courseIndex);
        buffer.push_back(p.day);
        buffer.push_back(p.slot);
        buffer.push_back(p.roomIndex);
    }
}

void deserializePlacements(const std::vector<int>& buffer, std::vector<Placement>& placements) {
    size_t count = buffer.size() / 4;
    placements.resize(count);
    for (size_t i = 0; i < count; ++i) {
        placements[i].courseIndex = buffer[4 * i + 0];
        placements[i].day         = buffer[4 * i + 1];
        placements[i].slot        = buffer[4 * i + 2];
        placements[i].roomIndex   = buffer[4 * i + 3];
    }
}
