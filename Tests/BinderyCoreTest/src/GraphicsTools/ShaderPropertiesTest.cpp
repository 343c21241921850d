/*
 *  Copyright 2024 Diligent Graphics LLC
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing, software
 *  distributed under the License is distributed on an "AS IS" BASIS,
 *  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *  See the License for the specific language governing permissions and
 *  limitations under the License.
 *
 *  In no event and under no legal theory, whether in tort (including negligence),
 *  contract, or otherwise, unless required by applicable law (such as deliberate
 *  and grossly negligent acts) or agreed to in writing, shall any Contributor be
 *  liable for any damages, including any direct, indirect, special, incidental,
 *  or consequential damages of any character arising as a result of this License or
 *  out of the use or inability to use the software (including but not limited to damages
 *  for loss of goodwill, work stoppage, computer failure or malfunction, or any and
 *  all other commercial damages or losses), even if such Contributor has been advised
 *  of the possibility of such damages.
 */


#include "ShaderProperties.hpp"

#include <cstring>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include "TestingEnvironment.hpp"

#include "gtest/gtest.h"

using namespace Bindery;
using namespace Bindery::Testing;

namespace
{

struct SolverProps
{
    ShaderPropertyID Positions;
    ShaderPropertyID Velocities;
    ShaderPropertyID Constants;
};

// clang-format off
static constexpr ShaderPropertyField<SolverProps> SolverPropFields[] =
{
    {"_Positions",  &SolverProps::Positions},
    {"_Velocities", &SolverProps::Velocities},
    {"_Constants",  &SolverProps::Constants},
};
// clang-format on

TEST(ShaderPropertiesTest, GetShaderPropertyID)
{
    const auto ID0 = GetShaderPropertyID("_PropertiesTestA");
    const auto ID1 = GetShaderPropertyID("_PropertiesTestB");
    EXPECT_NE(ID0, INVALID_SHADER_PROPERTY_ID);
    EXPECT_NE(ID1, INVALID_SHADER_PROPERTY_ID);
    EXPECT_NE(ID0, ID1);
    EXPECT_EQ(GetShaderPropertyID("_PropertiesTestA"), ID0);
    EXPECT_EQ(GetShaderPropertyID(String{"_PropertiesTestB"}.c_str()), ID1);

    EXPECT_STREQ(GetShaderPropertyName(ID0), "_PropertiesTestA");
    EXPECT_STREQ(GetShaderPropertyName(ID1), "_PropertiesTestB");
    EXPECT_EQ(GetShaderPropertyName(INVALID_SHADER_PROPERTY_ID), nullptr);
    EXPECT_EQ(GetShaderPropertyName(1 << 30), nullptr);

    TestingEnvironment::SetErrorAllowance(2, "\n\nNo worries, testing empty property names...\n\n");
    EXPECT_THROW(GetShaderPropertyID(""), std::runtime_error);
    EXPECT_THROW(GetShaderPropertyID(nullptr), std::runtime_error);
    TestingEnvironment::SetErrorAllowance(0);
}

TEST(ShaderPropertiesTest, NamesOutliveRegistryGrowth)
{
    const auto  FirstID   = GetShaderPropertyID("_GrowthTestFirst");
    const Char* FirstName = GetShaderPropertyName(FirstID);
    ASSERT_NE(FirstName, nullptr);

    std::vector<ShaderPropertyID> IDs;
    for (int i = 0; i < 1000; ++i)
        IDs.push_back(GetShaderPropertyID(("_GrowthTest" + std::to_string(i)).c_str()));

    // Registering more names must not move the strings handed out earlier
    EXPECT_EQ(GetShaderPropertyName(FirstID), FirstName);
    EXPECT_STREQ(FirstName, "_GrowthTestFirst");
    for (int i = 0; i < 1000; ++i)
    {
        EXPECT_EQ(IDs[i], FirstID + 1 + i);
        EXPECT_EQ(GetShaderPropertyID(("_GrowthTest" + std::to_string(i)).c_str()), IDs[i]);
    }
}

TEST(ShaderPropertiesTest, Multithreading)
{
    constexpr size_t NumThreads = 4;
    constexpr int    NumNames   = 64;

    std::vector<std::vector<ShaderPropertyID>> IDs(NumThreads);
    std::vector<std::thread>                   Threads;
    for (size_t t = 0; t < NumThreads; ++t)
    {
        Threads.emplace_back([&IDs, t]() {
            for (int i = 0; i < NumNames; ++i)
                IDs[t].push_back(GetShaderPropertyID(("_ThreadedProperty" + std::to_string(i)).c_str()));
        });
    }
    for (auto& Thread : Threads)
        Thread.join();

    for (size_t t = 1; t < NumThreads; ++t)
        EXPECT_EQ(IDs[t], IDs[0]);
}

TEST(ShaderPropertiesTest, InitializeShaderProperties)
{
    SolverProps Props{};
    InitializeShaderProperties(Props, SolverPropFields);
    EXPECT_EQ(Props.Positions, GetShaderPropertyID("_Positions"));
    EXPECT_EQ(Props.Velocities, GetShaderPropertyID("_Velocities"));
    EXPECT_EQ(Props.Constants, GetShaderPropertyID("_Constants"));
    EXPECT_NE(Props.Positions, Props.Velocities);
}

TEST(ShaderPropertiesTest, EnumerateFields)
{
    std::vector<String> Names;
    EnumerateFields(SolverPropFields, std::size(SolverPropFields),
                    [&](size_t Index, const ShaderPropertyField<SolverProps>& Field) {
                        EXPECT_EQ(Index, Names.size());
                        Names.emplace_back(Field.Name);
                    });
    EXPECT_EQ(Names, (std::vector<String>{"_Positions", "_Velocities", "_Constants"}));
}

TEST(ShaderPropertiesTest, InitializeStructFields)
{
    struct KernelIndices
    {
        Uint32 Integrate;
        Uint32 Constrain;
    };
    const StructField<KernelIndices, Uint32> Fields[] = {
        {"Integrate", &KernelIndices::Integrate},
        {"Constrain", &KernelIndices::Constrain},
    };

    KernelIndices Kernels{};
    InitializeStructFields(Kernels, Fields, 2, [](const Char* Name) { return static_cast<Uint32>(strlen(Name)); });
    EXPECT_EQ(Kernels.Integrate, 9u);
    EXPECT_EQ(Kernels.Constrain, 9u);

    const StructField<KernelIndices, Uint32> DuplicateNames[] = {
        {"Integrate", &KernelIndices::Integrate},
        {"Integrate", &KernelIndices::Constrain},
    };
    const StructField<KernelIndices, Uint32> DuplicateMembers[] = {
        {"Integrate", &KernelIndices::Integrate},
        {"Constrain", &KernelIndices::Integrate},
    };

    TestingEnvironment::SetErrorAllowance(2, "\n\nNo worries, testing invalid field tables...\n\n");
    EXPECT_THROW(InitializeStructFields(Kernels, DuplicateNames, 2, [](const Char*) { return 0u; }), std::runtime_error);
    EXPECT_THROW(InitializeStructFields(Kernels, DuplicateMembers, 2, [](const Char*) { return 0u; }), std::runtime_error);
    TestingEnvironment::SetErrorAllowance(0);

    // Nothing is written if the table is invalid
    EXPECT_EQ(Kernels.Integrate, 9u);
}

} // namespace
