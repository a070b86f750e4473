#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "vision/TfLiteModel.h"

static std::string tempPath(const char* name) {
  return std::string(::testing::TempDir()) + name;
}

TEST(TfLiteModel, MissingFileDoesNotLoad) {
  TfLiteModel model(1);
  EXPECT_FALSE(model.load("/nonexistent/amlac/model.tflite"));
  EXPECT_FALSE(model.isLoaded());
  EXPECT_EQ(0, model.inputSize());
}

TEST(TfLiteModel, GarbageFileDoesNotLoad) {
  const std::string path = tempPath("amlac_garbage.tflite");
  {
    std::ofstream f(path.c_str(), std::ios::binary);
    f << "this is not a flatbuffer";
  }

  TfLiteModel model(1);
  EXPECT_FALSE(model.load(path));
  EXPECT_FALSE(model.isLoaded());
  std::remove(path.c_str());
}

TEST(TfLiteModel, InferWithoutModelFails) {
  TfLiteModel model(1);
  ModelInput input;
  input.width = 2;
  input.height = 2;
  input.data.assign(12, 0.5f);

  std::vector<float> scores;
  EXPECT_FALSE(model.infer(input, scores));
  EXPECT_TRUE(scores.empty());
}
