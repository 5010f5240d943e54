#include "model/player.hpp"

#include <algorithm>

namespace monopoly {

PlayerAccount::PlayerAccount(PlayerId playerId) : id{playerId} {
}

bool PlayerAccount::owns(SpaceIndex index) const {
	return std::find(properties.begin(), properties.end(), index) != properties.end();
}

void PlayerAccount::addProperty(SpaceIndex index) {
	if (!owns(index)) {
		properties.push_back(index);
	}
}

void PlayerAccount::removeProperty(SpaceIndex index) {
	properties.erase(std::remove(properties.begin(), properties.end(), index), properties.end());
}

void PlayerAccount::reset() {
	*this = PlayerAccount{id};
}

} // namespace monopoly
