#pragma once

#include "model/types.hpp"

#include <vector>

namespace monopoly {

//! Token movement in flight. The engine owns the final position; renderers interpolate along the path.
struct MoveAnimation {
	std::vector<SpaceIndex> path; //!< Spaces visited in order. The last entry is the destination.
	double startTime{0.0};        //!< Virtual clock value when the move started.
	bool active{false};           //!< True while the token is moving.
};

//! Economic and positional state of one player.
struct PlayerAccount {
	PlayerId id{0u};
	Money cash{STARTING_MONEY};
	SpaceIndex position{GO_POSITION};
	std::vector<SpaceIndex> properties; //!< Owned deeds in acquisition order.

	bool inJail{false};
	unsigned jailTurns{0u};         //!< Failed release attempts during the current jail stay.
	unsigned jailFreeCards{0u};     //!< Get out of jail free cards held.
	unsigned consecutiveDoubles{0u}; //!< [0, SPEEDING_LIMIT]
	bool bankrupt{false};            //!< Terminal. Excludes the player from all further play.

	MoveAnimation move;

public:
	PlayerAccount() = default;
	explicit PlayerAccount(PlayerId playerId);

	bool owns(SpaceIndex index) const;
	void addProperty(SpaceIndex index);    //!< Append to the acquisition list.
	void removeProperty(SpaceIndex index); //!< Remove keeping the order of the remaining deeds.

	//! Reset to the state at game start.
	void reset();
};

} // namespace monopoly
