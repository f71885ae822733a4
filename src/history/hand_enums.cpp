#include "history/hand_enums.hpp"

#include "util/result.hpp"

#include <cassert>
#include <map>
#include <string>

namespace {
template <typename T>
Result<T> lookupName(const std::map<std::string, T>& names, const std::string& name, const std::string& enumName) {
    auto it = names.find(name);
    if (it == names.end()) {
        return makeError(ErrorKind::UnknownEnumerationValue, "\"" + name + "\" is not a valid " + enumName + ".");
    }
    return it->second;
}
} // namespace

Result<Limit> getLimitFromName(const std::string& name) {
    static const std::map<std::string, Limit> LimitNames = {
        { "NL", Limit::NoLimit },
        { "No Limit", Limit::NoLimit },
        { "PL", Limit::PotLimit },
        { "Pot Limit", Limit::PotLimit },
        { "FL", Limit::FixedLimit },
        { "Fix Limit", Limit::FixedLimit },
        { "Fixed Limit", Limit::FixedLimit },
        { "Limit", Limit::FixedLimit }
    };
    return lookupName(LimitNames, name, "limit");
}

std::string getLimitName(Limit limit) {
    switch (limit) {
        case Limit::NoLimit:
            return "NL";
        case Limit::PotLimit:
            return "PL";
        case Limit::FixedLimit:
            return "FL";
        default:
            assert(false);
            return "";
    }
}

Result<Game> getGameFromName(const std::string& name) {
    static const std::map<std::string, Game> GameNames = {
        { "Hold'em", Game::Holdem },
        { "Holdem", Game::Holdem },
        { "Omaha", Game::Omaha },
        { "Omaha Hi", Game::Omaha },
        { "Omaha Hi/Lo", Game::OmahaHiLo },
        { "Omaha H/L", Game::OmahaHiLo },
        { "Razz", Game::Razz },
        { "Stud", Game::Stud },
        { "7 Card Stud", Game::Stud },
        { "Stud Hi/Lo", Game::StudHiLo },
        { "7 Card Stud Hi/Lo", Game::StudHiLo }
    };
    return lookupName(GameNames, name, "game");
}

std::string getGameName(Game game) {
    switch (game) {
        case Game::Holdem:
            return "Hold'em";
        case Game::Omaha:
            return "Omaha";
        case Game::OmahaHiLo:
            return "Omaha Hi/Lo";
        case Game::Razz:
            return "Razz";
        case Game::Stud:
            return "Stud";
        case Game::StudHiLo:
            return "Stud Hi/Lo";
        default:
            assert(false);
            return "";
    }
}

std::string getGameTypeName(GameType gameType) {
    switch (gameType) {
        case GameType::Cash:
            return "Cash game";
        case GameType::Tournament:
            return "Tournament";
        case GameType::SitAndGo:
            return "Sit & Go";
        default:
            assert(false);
            return "";
    }
}

Result<Currency> getCurrencyFromName(const std::string& name) {
    static const std::map<std::string, Currency> CurrencyNames = {
        { "USD", Currency::USD },
        { "$", Currency::USD },
        { "EUR", Currency::EUR },
        { "€", Currency::EUR },
        { "GBP", Currency::GBP },
        { "£", Currency::GBP },
        { "Play", Currency::Play }
    };
    return lookupName(CurrencyNames, name, "currency");
}

std::string getCurrencyName(Currency currency) {
    switch (currency) {
        case Currency::USD:
            return "USD";
        case Currency::EUR:
            return "EUR";
        case Currency::GBP:
            return "GBP";
        case Currency::Play:
            return "Play";
        default:
            assert(false);
            return "";
    }
}

Result<ActionType> getActionTypeFromVerb(const std::string& verb) {
    static const std::map<std::string, ActionType> ActionVerbs = {
        { "bets", ActionType::Bet },
        { "raises", ActionType::Raise },
        { "calls", ActionType::Call },
        { "checks", ActionType::Check },
        { "folds", ActionType::Fold },
        { "mucks", ActionType::Muck },
        { "shows", ActionType::Show }
    };
    return lookupName(ActionVerbs, verb, "action");
}

std::string getActionTypeName(ActionType actionType) {
    switch (actionType) {
        case ActionType::Bet:
            return "bet";
        case ActionType::Raise:
            return "raise";
        case ActionType::Call:
            return "call";
        case ActionType::Check:
            return "check";
        case ActionType::Fold:
            return "fold";
        case ActionType::Muck:
            return "muck";
        case ActionType::Show:
            return "show";
        case ActionType::Think:
            return "think";
        case ActionType::Return:
            return "return";
        case ActionType::Win:
            return "win";
        default:
            assert(false);
            return "";
    }
}
