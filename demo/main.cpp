#include <any>
#include <iostream>
#include <string>
#include <vector>

#include "cerealizer/core/log/Log.h"
#include "cerealizer/core/reflect/class_db.h"
#include "cerealizer/core/reflect/serialize.h"
#include "cerealizer/main/cereal_engine.h"

enum class Visibility { Shown, Hidden };

class SceneNode {
public:
    static void register_class() {
        Registry::add_enum<Visibility>("Visibility")
            .value("Shown", Visibility::Shown)
            .value("Hidden", Visibility::Hidden);
        Registry::add<SceneNode>("SceneNode")
            .member("name", &SceneNode::name_)
            .member("visibility", &SceneNode::visibility_)
            .member("children", &SceneNode::children_)
            .member("payload", &SceneNode::payload_);
    }

    SceneNode() = default;
    explicit SceneNode(std::string name) : name_(std::move(name)) {}

    SceneNode& add_child(SceneNode child) {
        children_.push_back(std::move(child));
        return *this;
    }
    void set_payload(std::any payload) { payload_ = std::move(payload); }
    void hide() { visibility_ = Visibility::Hidden; }

    const std::string& name() const { return name_; }
    const std::vector<SceneNode>& children() const { return children_; }

private:
    std::string name_;
    Visibility visibility_ = Visibility::Shown;
    std::vector<SceneNode> children_;
    std::any payload_;
};

REGISTER_CLASS_IMPL(SceneNode)

int main() {
    std::bitset<8> mode;
    mode.set(CerealEngine::StartMode::Log_);
    mode.set(CerealEngine::StartMode::Class_Hints_);
    CerealEngine engine(mode);
    INFO("Logger initialized successfully!");

    SceneNode leaf("leaf");
    leaf.hide();
    leaf.set_payload(std::vector<std::any>{std::string("tag"), 42});

    SceneNode root("root");
    root.add_child(leaf);

    try {
        CerealValue cereal = engine.cerealize(root);
        std::cout << CerealJson::dump(cereal) << std::endl;

        std::any restored = engine.decerealize(cereal);
        const auto& node = std::any_cast<const SceneNode&>(restored);
        INFO("Restored {} with {} child(ren)", node.name(), node.children().size());

        CerealValue again = engine.cerealize(node);
        if (again != cereal) {
            ERR("Round trip changed the value: {}", CerealJson::brief(again));
            Log::shutdown();
            return 1;
        }
    } catch (const CerealException& e) {
        ERR("Cerealization failed: {}", e.what());
        Log::shutdown();
        return 1;
    }

    Log::shutdown();
    return 0;
}
