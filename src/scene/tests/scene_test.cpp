#include <scene/scene.h>
#include <scene/error.h>

#include <hierarchy/search.h>

#include <yaml-cpp/yaml.h>

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using arbor::scene::Tags;
using arbor::scene::Scene;
using arbor::scene::Object;
using arbor::scene::TagError;
using arbor::scene::SceneError;

namespace search = arbor::hierarchy::search;

namespace {
    const char *shapes = R"(
tags: [Circle, Square]
root:
  name: ParentOfShapes
  children:
    - name: Circles
      tags: [Circle]
      children:
        - name: Circle1
          tags: [Circle]
        - name: Square5
          tags: [Square]
          active: false
    - name: Squares
      children:
        - name: Square1
          tags: [Square]
        - name: Group
          children:
            - name: Square5
              tags: [Square]
)";

    class SceneTest : public ::testing::Test {
    protected:
        std::unique_ptr<Scene> scene;

        void SetUp() override { scene = std::make_unique<Scene>(YAML::Load(shapes)); }
    };
}

TEST_F(SceneTest, LoadsObjectsInOrder) {
    auto root = scene->root.get();

    EXPECT_EQ(root->name(), "ParentOfShapes");
    ASSERT_EQ(root->childCount(), 2u);
    EXPECT_EQ(root->child(0)->name(), "Circles");
    EXPECT_EQ(root->child(1)->name(), "Squares");
    EXPECT_EQ(root->child(0)->parent(), root);
    EXPECT_EQ(root->parent(), nullptr);

    EXPECT_TRUE(scene->tags->contains("Circle"));
    EXPECT_FALSE(scene->tags->contains("Triangle"));
}

TEST_F(SceneTest, ReadsActiveAndTags) {
    auto hidden = scene->find("/ParentOfShapes/Circles/Square5");

    ASSERT_NE(hidden, nullptr);
    EXPECT_FALSE(hidden->isActive());
    EXPECT_TRUE(hidden->hasTag("Square"));
    EXPECT_FALSE(hidden->hasTag("Circle"));

    EXPECT_TRUE(scene->root->isActive());
}

TEST_F(SceneTest, FindResolvesAbsolutePaths) {
    EXPECT_EQ(scene->find("/ParentOfShapes"), scene->root.get());
    EXPECT_EQ(scene->find("ParentOfShapes/Squares/Group/Square5")->name(), "Square5");

    EXPECT_EQ(scene->find("/Other/Squares"), nullptr);
    EXPECT_EQ(scene->find("/ParentOfShapes/Missing"), nullptr);
    EXPECT_EQ(scene->find("/"), nullptr);

    EXPECT_THROW((void)scene->findThrows("/ParentOfShapes/Missing"), std::runtime_error);
}

TEST_F(SceneTest, FindAgreesWithPath) {
    auto object = scene->find("/ParentOfShapes/Squares/Group/Square5");

    ASSERT_NE(object, nullptr);
    EXPECT_EQ(scene->find(search::path(object)), object);
}

TEST_F(SceneTest, SearchSkipsInactiveSquare) {
    auto root = scene->root.get();

    auto depthFirst = search::descendantNamed(root, "Square5", true);
    auto anyDepthFirst = search::descendantNamed(root, "Square5", false);

    ASSERT_NE(depthFirst, nullptr);
    EXPECT_EQ(search::path(depthFirst), "/ParentOfShapes/Squares/Group/Square5");
    EXPECT_EQ(search::path(anyDepthFirst), "/ParentOfShapes/Circles/Square5");

    EXPECT_EQ(search::descendantsTagged(root, "Square", true).size(), 2u);
    EXPECT_EQ(search::descendantsTagged(root, "Square", false).size(), 3u);
}

TEST_F(SceneTest, AncestorByTag) {
    auto circle = scene->find("/ParentOfShapes/Circles/Circle1");

    auto parent = search::ancestorTagged(circle, "Circle");

    ASSERT_NE(parent, nullptr);
    EXPECT_EQ(parent->name(), "Circles");
    EXPECT_EQ(search::ancestorNamed(circle, "ParentOfShapes"), scene->root.get());
}

TEST_F(SceneTest, UnknownTagQueryThrows) {
    auto root = scene->root.get();

    EXPECT_THROW((void)root->hasTag("Triangle"), TagError);
    EXPECT_THROW(search::descendantTagged(root, "Triangle", false), TagError);
    EXPECT_THROW(search::ancestorTagged(scene->find("/ParentOfShapes/Circles"), "Triangle"), TagError);

    try {
        (void)root->hasTag("Triangle");
    } catch (const TagError &e) {
        EXPECT_EQ(e.tag, "Triangle");
        EXPECT_STREQ(e.what(), "Tag \"Triangle\" is not defined.");
    }
}

TEST(SceneLoad, RejectsUnregisteredTags) {
    EXPECT_THROW(Scene(YAML::Load("root: { name: A, tags: [Circle] }")), TagError);
}

TEST(SceneLoad, RejectsMalformedDescriptions) {
    EXPECT_THROW(Scene(YAML::Load("tags: [Circle]")), SceneError);
    EXPECT_THROW(Scene(YAML::Load("root: { active: false }")), SceneError);
    EXPECT_THROW(Scene(YAML::Load("root: { name: A, children: { name: B } }")), SceneError);
    EXPECT_THROW(Scene(YAML::Load("root: { name: A, children: [ { active: true } ] }")), SceneError);
}

TEST(SceneLoad, RejectsWronglyShapedValues) {
    EXPECT_THROW(Scene(YAML::Load("root: { name: A, children: [ B ] }")), SceneError);
    EXPECT_THROW(Scene(YAML::Load("tags: Circle\nroot: { name: A }")), SceneError);
    EXPECT_THROW(Scene(YAML::Load("root: A")), SceneError);

    EXPECT_THROW(Scene(YAML::Load("just a string")), SceneError);
    EXPECT_THROW(Scene(YAML::Load("root: { name: [ A ] }")), SceneError);
    EXPECT_THROW(Scene(YAML::Load("root: { name: A, active: maybe }")), SceneError);
    EXPECT_THROW(Scene(YAML::Load("tags: [Circle]\nroot: { name: A, tags: Circle }")), SceneError);
    EXPECT_THROW(Scene(YAML::Load("tags: [ [Circle] ]\nroot: { name: A }")), SceneError);
}

TEST(SceneLoad, MissingFile) {
    EXPECT_FALSE(Scene::loadFrom("does-not-exist.yaml").has_value());
    EXPECT_THROW(Scene::loadFromThrows("does-not-exist.yaml"), std::runtime_error);
}

TEST(SceneLoad, ReadsFile) {
    auto path = testing::TempDir() + "arbor-scene.yaml";

    {
        std::ofstream stream(path);
        stream << shapes;
    }

    auto scene = Scene::loadFromThrows(path);

    EXPECT_EQ(scene.root->name(), "ParentOfShapes");
    EXPECT_NE(scene.find("/ParentOfShapes/Squares/Square1"), nullptr);

    std::remove(path.c_str());
}

TEST(SceneObjects, EditsAreVisibleToSearch) {
    Scene scene(std::make_shared<Tags>(std::vector<std::string> { "Circle" }), "A");

    auto b = scene.root->create("B");
    auto c = b->create("C");
    auto d = b->create("D");

    EXPECT_EQ(search::path(d), "/A/B/D");
    EXPECT_EQ(search::descendantNamed(scene.root.get(), "D", false), d);

    d->setActive(false);
    EXPECT_EQ(search::descendantNamed(scene.root.get(), "D", true), nullptr);

    b->addTag("Circle");
    EXPECT_EQ(search::ancestorTagged(d, "Circle"), b);

    b->removeTag("Circle");
    EXPECT_EQ(search::ancestorTagged(d, "Circle"), nullptr);

    EXPECT_THROW(b->addTag("Square"), TagError);

    d->moveTo(c);
    EXPECT_EQ(search::path(d), "/A/B/C/D");
    EXPECT_EQ(b->childCount(), 1u);

    c->rename("Renamed");
    EXPECT_EQ(search::path(d), "/A/B/Renamed/D");
}

TEST(SceneObjects, MoveRejectsCycles) {
    Scene scene(nullptr, "A");

    auto b = scene.root->create("B");
    auto c = b->create("C");

    EXPECT_THROW(b->moveTo(c), SceneError);
    EXPECT_THROW(b->moveTo(b), SceneError);
    EXPECT_THROW(scene.root->moveTo(b), SceneError);

    EXPECT_THROW(b->moveTo(nullptr), SceneError);
    EXPECT_THROW(c->moveTo(nullptr), SceneError);

    EXPECT_EQ(search::path(c), "/A/B/C");
    EXPECT_EQ(scene.root->childCount(), 1u);
    EXPECT_EQ(b->childCount(), 1u);
}

TEST(SceneObjects, AddRejectsParentedObjects) {
    Scene scene(nullptr, "A");

    auto object = std::make_unique<Object>(scene.tags, "B");
    auto raw = scene.root->add(std::move(object));

    EXPECT_EQ(raw->owner(), scene.root.get());
    EXPECT_THROW(scene.root->add(nullptr), SceneError);
}
