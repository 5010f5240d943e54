#include "core/snapshot.hpp"

#include "Logging.hpp"
#include "model/classicBoard.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace monopoly {

using nlohmann::json;

static constexpr unsigned SNAPSHOT_VERSION = 2u;

static void require(const bool condition, const char* message) {
	if (!condition) {
		throw std::invalid_argument(message);
	}
}

template <class T>
static json toJson(const std::optional<T>& value) {
	return value ? json(*value) : json(nullptr);
}

template <class T>
static std::optional<T> optionalFrom(const json& value) {
	if (value.is_null()) {
		return {};
	}
	return value.get<T>();
}

static json toJson(const MoveContext& context) {
	return {
	        {"forward", context.forward},
	        {"collectGo", context.collectGo},
	        {"fromCard", context.fromCard},
	        {"rentMultiplier", context.rentMultiplier},
	        {"goCredited", context.goCredited},
	};
}

static MoveContext moveContextFrom(const json& object) {
	return {
	        .forward        = object.at("forward").get<bool>(),
	        .collectGo      = object.at("collectGo").get<bool>(),
	        .fromCard       = object.at("fromCard").get<bool>(),
	        .rentMultiplier = object.at("rentMultiplier").get<unsigned>(),
	        .goCredited     = object.at("goCredited").get<bool>(),
	};
}

static std::vector<SpaceIndex> pathFrom(const json& array) {
	auto path = array.get<std::vector<SpaceIndex>>();
	require(std::all_of(path.begin(), path.end(), isValidSpace), "path leaves the board");
	return path;
}

static json toJson(const PlayerAccount& player) {
	return {
	        {"id", player.id},
	        {"cash", player.cash},
	        {"position", player.position},
	        {"properties", player.properties},
	        {"inJail", player.inJail},
	        {"jailTurns", player.jailTurns},
	        {"jailFreeCards", player.jailFreeCards},
	        {"consecutiveDoubles", player.consecutiveDoubles},
	        {"bankrupt", player.bankrupt},
	        {"move", {{"path", player.move.path}, {"startTime", player.move.startTime}, {"active", player.move.active}}},
	};
}

static PlayerAccount playerFrom(const json& object, const PlayerId expectedId) {
	PlayerAccount player{object.at("id").get<PlayerId>()};
	require(player.id == expectedId, "player ids must match their seat");

	player.cash               = object.at("cash").get<Money>();
	player.position           = object.at("position").get<SpaceIndex>();
	player.properties         = object.at("properties").get<std::vector<SpaceIndex>>();
	player.inJail             = object.at("inJail").get<bool>();
	player.jailTurns          = object.at("jailTurns").get<unsigned>();
	player.jailFreeCards      = object.at("jailFreeCards").get<unsigned>();
	player.consecutiveDoubles = object.at("consecutiveDoubles").get<unsigned>();
	player.bankrupt           = object.at("bankrupt").get<bool>();

	const auto& move       = object.at("move");
	player.move.path       = pathFrom(move.at("path"));
	player.move.startTime  = move.at("startTime").get<double>();
	player.move.active     = move.at("active").get<bool>();

	require(isValidSpace(player.position), "player position leaves the board");
	require(player.consecutiveDoubles <= SPEEDING_LIMIT, "doubles streak out of range");
	require(!player.move.active || !player.move.path.empty(), "active move without a path");
	return player;
}

static json toJson(const Popup& popup) {
	return {
	        {"kind", static_cast<unsigned>(popup.kind)},
	        {"player", popup.player},
	        {"space", toJson(popup.space)},
	        {"amount", popup.amount},
	        {"counterparty", toJson(popup.counterparty)},
	        {"deck", popup.deck ? json(static_cast<unsigned>(*popup.deck)) : json(nullptr)},
	        {"cardId", popup.cardId},
	        {"text", popup.text},
	        {"page", popup.page},
	};
}

static Popup popupFrom(const json& object) {
	const auto kind = object.at("kind").get<unsigned>();
	require(kind <= static_cast<unsigned>(PopupKind::Trade), "unknown popup kind");

	Popup popup{
	        .kind         = static_cast<PopupKind>(kind),
	        .player       = object.at("player").get<PlayerId>(),
	        .space        = optionalFrom<SpaceIndex>(object.at("space")),
	        .amount       = object.at("amount").get<Money>(),
	        .counterparty = optionalFrom<PlayerId>(object.at("counterparty")),
	        .cardId       = object.at("cardId").get<std::string>(),
	        .text         = object.at("text").get<std::string>(),
	        .page         = object.at("page").get<unsigned>(),
	};

	if (const auto deck = optionalFrom<unsigned>(object.at("deck"))) {
		require(*deck <= static_cast<unsigned>(DeckKind::CommunityChest), "unknown deck");
		popup.deck = static_cast<DeckKind>(*deck);
	}
	require(!popup.space || isValidSpace(*popup.space), "popup space leaves the board");
	return popup;
}

static json toJson(const TradeOffer& trade) {
	return {
	        {"initiator", trade.initiator},
	        {"partner", trade.partner},
	        {"offerMoney", trade.offerMoney},
	        {"requestMoney", trade.requestMoney},
	        {"offerDeeds", trade.offerDeeds},
	        {"requestDeeds", trade.requestDeeds},
	        {"awaitingResponse", trade.stage == TradeStage::AwaitingResponse},
	};
}

static TradeOffer tradeFrom(const json& object) {
	TradeOffer trade{
	        .initiator    = object.at("initiator").get<PlayerId>(),
	        .partner      = object.at("partner").get<PlayerId>(),
	        .offerMoney   = object.at("offerMoney").get<Money>(),
	        .requestMoney = object.at("requestMoney").get<Money>(),
	        .offerDeeds   = object.at("offerDeeds").get<std::vector<SpaceIndex>>(),
	        .requestDeeds = object.at("requestDeeds").get<std::vector<SpaceIndex>>(),
	        .stage        = object.at("awaitingResponse").get<bool>() ? TradeStage::AwaitingResponse : TradeStage::Editing,
	};
	require(trade.offerMoney >= 0 && trade.requestMoney >= 0, "negative trade money");
	return trade;
}

json toSnapshot(const GameState& state) {
	json deeds = json::array();
	for (SpaceIndex index = 0u; index != state.board.size(); ++index) {
		if (!isPurchasable(state.board.space(index).kind)) {
			continue;
		}

		const auto& deed = state.board.deed(index);
		deeds.push_back({{"index", index}, {"owner", toJson(deed.owner)}, {"houses", deed.houses}, {"mortgaged", deed.mortgaged}});
	}

	json players = json::array();
	for (const auto& player: state.players) {
		players.push_back(toJson(player));
	}

	json pendingMove = nullptr;
	if (state.pendingMove) {
		pendingMove = {{"path", state.pendingMove->path}, {"context", toJson(state.pendingMove->context)}};
	}

	return {
	        {"version", SNAPSHOT_VERSION},
	        {"players", players},
	        {"deeds", deeds},
	        {"turnOrder", state.turnOrder},
	        {"turnIndex", state.turnIndex},
	        {"phase", std::string(toString(state.phase))},
	        {"dice", {state.dice.first, state.dice.second}},
	        {"diceSum", toJson(state.diceSum)},
	        {"chance", state.chance.order()},
	        {"communityChest", state.communityChest.order()},
	        {"popup", state.popup ? toJson(*state.popup) : json(nullptr)},
	        {"pendingMove", pendingMove},
	        {"trade", state.trade ? toJson(*state.trade) : json(nullptr)},
	        {"moveContext", toJson(state.moveContext)},
	        {"clock", state.clock},
	        {"turn", state.turn},
	};
}

//! Deed owners and property lists have to describe the same ownership.
static void checkOwnership(const GameState& state) {
	for (const auto& player: state.players) {
		for (const auto index: player.properties) {
			require(isValidSpace(index) && isPurchasable(state.board.space(index).kind), "property list names a space that cannot be owned");
			require(state.board.deed(index).owner == player.id, "property list and deed owner disagree");
		}
		require(!player.bankrupt || player.properties.empty(), "bankrupt player holds deeds");
	}

	for (SpaceIndex index = 0u; index != state.board.size(); ++index) {
		if (const auto owner = state.board.deed(index).owner) {
			const auto& properties = state.players[*owner].properties;
			require(std::find(properties.begin(), properties.end(), index) != properties.end(), "deed owner does not list the deed");
		}
	}
}

static bool popupOfCurrent(const GameState& state, const PopupKind kind) {
	const auto current = currentPlayer(state);
	return state.popup && state.popup->kind == kind && current && state.popup->player == *current;
}

static void checkTrade(const GameState& state) {
	require(state.trade.has_value() == (state.popup && state.popup->kind == PopupKind::Trade), "trade and trade popup disagree");
	if (!state.trade) {
		return;
	}

	const auto& trade = *state.trade;
	require(trade.initiator == currentPlayer(state), "trade not started by the current player");
	require(trade.partner < state.players.size() && trade.partner != trade.initiator && !state.players[trade.partner].bankrupt,
	        "trade partner cannot trade");

	const auto answering = trade.stage == TradeStage::Editing ? trade.initiator : trade.partner;
	require(state.popup->player == answering, "trade popup shown to the wrong player");

	const auto ownedBy = [&](const std::vector<SpaceIndex>& deeds, PlayerId owner) {
		return std::all_of(deeds.begin(), deeds.end(), [&](SpaceIndex index) { return isValidSpace(index) && state.board.deed(index).owner == owner; });
	};
	require(ownedBy(trade.offerDeeds, trade.initiator) && ownedBy(trade.requestDeeds, trade.partner), "trade names deeds the giver does not own");
}

//! Phase, popup, moves and the current seat have to fit together, otherwise the resumed game could not make progress.
static void checkTurnState(const GameState& state) {
	const auto current = currentPlayer(state);
	require(current || solventPlayers(state).empty(), "current seat is bankrupt");

	switch (state.phase) {
	case Phase::Roll:
		require(!state.popup || popupOfCurrent(state, PopupKind::Properties) || state.popup->kind == PopupKind::Trade,
		        "popup does not belong to the roll phase");
		break;
	case Phase::Moving:
		require(!state.popup, "popup while a token moves");
		require(current && state.players[*current].move.active, "moving phase without a token in flight");
		break;
	case Phase::Buying:
		require(popupOfCurrent(state, PopupKind::Buy) && state.popup->space.has_value(), "buying phase without a buy popup");
		break;
	case Phase::PayingRent:
		require(popupOfCurrent(state, PopupKind::Rent), "rent phase without a rent popup");
		break;
	case Phase::CardPending:
		require(popupOfCurrent(state, PopupKind::Card), "card phase without a card popup");
		break;
	}

	for (const auto& player: state.players) {
		require(!player.move.active || (state.phase == Phase::Moving && player.id == current), "token in flight outside the current move");
	}
	require(!state.pendingMove || (state.popup && state.popup->kind == PopupKind::Card), "pending move without a card popup");
	checkTrade(state);
}

static GameState stateFrom(const json& snapshot) {
	require(snapshot.at("version").get<unsigned>() == SNAPSHOT_VERSION, "unsupported snapshot version");

	GameState state{classicBoard()};

	const auto& players = snapshot.at("players");
	require(players.is_array() && !players.empty(), "snapshot has no players");
	for (PlayerId id = 0u; id != players.size(); ++id) {
		state.players.push_back(playerFrom(players[id], id));
	}

	for (const auto& entry: snapshot.at("deeds")) {
		const auto index = entry.at("index").get<SpaceIndex>();
		require(isValidSpace(index) && isPurchasable(state.board.space(index).kind), "deed of a space that cannot be owned");

		const auto owner  = optionalFrom<PlayerId>(entry.at("owner"));
		const auto houses = entry.at("houses").get<unsigned>();
		require(!owner || *owner < state.players.size(), "deed owner is not seated");
		require(houses <= HOTEL, "house count out of range");

		state.board.setOwner(index, owner);
		state.board.setHouses(index, houses);
		state.board.setMortgaged(index, entry.at("mortgaged").get<bool>());
	}
	checkOwnership(state);

	state.turnOrder = snapshot.at("turnOrder").get<std::vector<PlayerId>>();
	state.turnIndex = snapshot.at("turnIndex").get<std::size_t>();
	require(!state.turnOrder.empty() && state.turnIndex < state.turnOrder.size(), "turn index out of range");
	require(std::all_of(state.turnOrder.begin(), state.turnOrder.end(), [&](PlayerId id) { return id < state.players.size(); }),
	        "turn order names an unseated player");

	const auto phase = phaseFromString(snapshot.at("phase").get<std::string>());
	require(phase.has_value(), "unknown phase");
	state.phase = *phase;

	const auto dice = snapshot.at("dice").get<std::vector<unsigned>>();
	require(dice.size() == 2u && dice[0] <= 6u && dice[1] <= 6u, "dice faces out of range");
	state.dice    = {dice[0], dice[1]};
	state.diceSum = optionalFrom<unsigned>(snapshot.at("diceSum"));

	state.chance         = CardDeck(chanceCards());
	state.communityChest = CardDeck(communityChestCards());
	require(state.chance.restoreOrder(snapshot.at("chance").get<std::vector<std::string>>()), "chance deck order does not match the deck");
	require(state.communityChest.restoreOrder(snapshot.at("communityChest").get<std::vector<std::string>>()),
	        "community chest deck order does not match the deck");

	if (const auto& popup = snapshot.at("popup"); !popup.is_null()) {
		state.popup = popupFrom(popup);
	}
	if (const auto& pending = snapshot.at("pendingMove"); !pending.is_null()) {
		state.pendingMove = PendingMove{.path = pathFrom(pending.at("path")), .context = moveContextFrom(pending.at("context"))};
		require(!state.pendingMove->path.empty(), "pending move without a path");
	}

	if (const auto& trade = snapshot.at("trade"); !trade.is_null()) {
		state.trade = tradeFrom(trade);
	}

	state.moveContext = moveContextFrom(snapshot.at("moveContext"));
	state.clock       = snapshot.at("clock").get<double>();
	state.turn        = snapshot.at("turn").get<unsigned>();

	checkTurnState(state);
	return state;
}

std::optional<GameState> fromSnapshot(const json& snapshot) {
	try {
		return stateFrom(snapshot);
	} catch (const json::exception& e) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Snapshot] Malformed snapshot: {}", e.what()));
	} catch (const std::invalid_argument& e) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Snapshot] Inconsistent snapshot: {}", e.what()));
	}
	return {};
}

} // namespace monopoly
