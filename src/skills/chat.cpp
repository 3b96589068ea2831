#include <future>

#include "skills/builtin.hpp"

namespace ctxmgr::skills {

using tool::Schema;

skill::Skill make_chat_skill() {
  skill::Skill skill;
  skill.id = "chat";
  skill.name = "Chat";
  skill.description = "Conversation helpers for checking the tool round trip";
  skill.version = "1.0.0";

  skill.tools.push_back({
      {"echo", "Echo a message back to the caller", Schema::object({{"message", Schema::string().describe("Message to echo")}})},
      [](const json &input) {
        std::promise<json> promise;
        promise.set_value(json("Echo: " + input["message"].get<std::string>()));
        return promise.get_future();
      },
  });

  return skill;
}

}  // namespace ctxmgr::skills
