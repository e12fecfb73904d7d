#include <scene/object.h>

#include <scene/error.h>

#include <algorithm>

namespace arbor::scene {
    size_t Object::childCount() const { return childObjects.size(); }

    const hierarchy::Node *Object::child(size_t index) const { return childObjects.at(index).get(); }

    const hierarchy::Node *Object::parent() const { return parentObject; }

    std::string Object::name() const { return objectName; }

    bool Object::isActive() const { return active; }

    bool Object::hasTag(const std::string &tag) const {
        registry->verify(tag);

        return tagNames.find(tag) != tagNames.end();
    }

    Object *Object::add(std::unique_ptr<Object> object) {
        if (!object)
            throw SceneError("Cannot add an empty object to {}.", objectName);

        if (object->parentObject)
            throw SceneError("Object {} already has a parent.", object->objectName);

        object->parentObject = this;
        childObjects.push_back(std::move(object));

        return childObjects.back().get();
    }

    Object *Object::create(std::string name) {
        return add(std::make_unique<Object>(registry, std::move(name)));
    }

    void Object::moveTo(Object *target) {
        if (!target)
            throw SceneError("Cannot move {} to an empty object.", objectName);

        if (!parentObject)
            throw SceneError("Cannot move root object {}.", objectName);

        for (auto check = target; check; check = check->parentObject) {
            if (check == this)
                throw SceneError("Cannot move {} underneath itself.", objectName);
        }

        auto &siblings = parentObject->childObjects;
        auto it = std::find_if(siblings.begin(), siblings.end(), [this](const auto &e) { return e.get() == this; });

        if (it == siblings.end())
            throw SceneError("Object {} is missing from its parent.", objectName);

        auto self = std::move(*it);
        siblings.erase(it);

        self->parentObject = nullptr;
        target->add(std::move(self));
    }

    void Object::rename(std::string value) { objectName = std::move(value); }

    void Object::setActive(bool value) { active = value; }

    void Object::addTag(const std::string &tag) {
        registry->verify(tag);

        tagNames.insert(tag);
    }

    void Object::removeTag(const std::string &tag) { tagNames.erase(tag); }

    Object::Object(std::shared_ptr<const Tags> registry, std::string name)
        : registry(std::move(registry)), objectName(std::move(name)) {
        if (!this->registry)
            throw SceneError("Object {} needs a tag registry.", objectName);
    }
}
