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


#include "RenderDeviceHost.h"
#include "BufferHost.h"
#include "TextureHost.h"
#include "ShaderProgramHost.h"
#include "GraphicsAccessories.hpp"

#include "TestingEnvironment.hpp"

#include "gtest/gtest.h"

using namespace Bindery;
using namespace Bindery::Testing;

namespace
{

TEST(RenderDeviceHostTest, CreateBuffer)
{
    auto* pDevice = TestingEnvironment::GetInstance()->GetDevice();

    const Uint32 InitData[] = {1, 2, 3, 4};

    BufferDesc Desc{"Init data buffer", 32, BIND_SHADER_RESOURCE, BUFFER_MODE_STRUCTURED, COMPUTE_BUFFER_TYPE_STRUCTURED, 8};
    BufferData Data{InitData, sizeof(InitData)};

    RefCntAutoPtr<IBuffer> pBuffer;
    pDevice->CreateBuffer(Desc, &Data, &pBuffer);
    ASSERT_NE(pBuffer, nullptr);
    EXPECT_EQ(pBuffer->GetDesc(), Desc);
    EXPECT_STREQ(pBuffer->GetDesc().Name, "Init data buffer");
    EXPECT_GT(pBuffer->GetUniqueID(), 0);
    EXPECT_TRUE(pBuffer->IsValid());

    RefCntAutoPtr<IBufferHost> pBufferHost{pBuffer, IID_BufferHost};
    ASSERT_NE(pBufferHost, nullptr);
    const auto* pStorage = static_cast<const Uint32*>(pBufferHost->GetData());
    EXPECT_EQ(pStorage[0], 1u);
    EXPECT_EQ(pStorage[3], 4u);
    // The rest of the buffer is zero-initialized
    EXPECT_EQ(pStorage[4], 0u);
    EXPECT_EQ(pStorage[7], 0u);

    // Unique IDs are never reused
    RefCntAutoPtr<IBuffer> pBuffer2;
    pDevice->CreateBuffer(Desc, nullptr, &pBuffer2);
    ASSERT_NE(pBuffer2, nullptr);
    EXPECT_NE(pBuffer2->GetUniqueID(), pBuffer->GetUniqueID());
}

TEST(RenderDeviceHostTest, CreateBuffer_InvalidDesc)
{
    auto* pDevice = TestingEnvironment::GetInstance()->GetDevice();

    auto TestInvalidDesc = [pDevice](const BufferDesc& Desc) {
        // Validation error and creation failure
        TestingEnvironment::SetErrorAllowance(2);
        RefCntAutoPtr<IBuffer> pBuffer;
        pDevice->CreateBuffer(Desc, nullptr, &pBuffer);
        EXPECT_EQ(pBuffer, nullptr) << GetBufferDescString(Desc);
        TestingEnvironment::SetErrorAllowance(0);
    };

    std::cout << "\n\nNo worries, testing invalid buffer descriptions...\n\n";

    // clang-format off
    TestInvalidDesc(BufferDesc{"Zero size",         0,  BIND_SHADER_RESOURCE, BUFFER_MODE_STRUCTURED, COMPUTE_BUFFER_TYPE_DEFAULT,            16});
    TestInvalidDesc(BufferDesc{"Zero stride",       64, BIND_SHADER_RESOURCE, BUFFER_MODE_STRUCTURED, COMPUTE_BUFFER_TYPE_DEFAULT,            0});
    TestInvalidDesc(BufferDesc{"Unaligned stride",  60, BIND_SHADER_RESOURCE, BUFFER_MODE_STRUCTURED, COMPUTE_BUFFER_TYPE_DEFAULT,            6});
    TestInvalidDesc(BufferDesc{"Partial element",   40, BIND_SHADER_RESOURCE, BUFFER_MODE_STRUCTURED, COMPUTE_BUFFER_TYPE_DEFAULT,            16});
    TestInvalidDesc(BufferDesc{"Undefined mode",    64, BIND_SHADER_RESOURCE, BUFFER_MODE_UNDEFINED,  COMPUTE_BUFFER_TYPE_DEFAULT,            16});
    TestInvalidDesc(BufferDesc{"Constant as UAV",   64, BIND_UNORDERED_ACCESS,BUFFER_MODE_STRUCTURED, COMPUTE_BUFFER_TYPE_CONSTANT,           16});
    TestInvalidDesc(BufferDesc{"Args without flag", 16, BIND_UNORDERED_ACCESS,BUFFER_MODE_RAW,        COMPUTE_BUFFER_TYPE_INDIRECT_ARGUMENTS, 4});
    TestInvalidDesc(BufferDesc{"Structured raw",    64, BIND_SHADER_RESOURCE, BUFFER_MODE_STRUCTURED, COMPUTE_BUFFER_TYPE_RAW,                4});
    // clang-format on
}

TEST(RenderDeviceHostTest, CreateTexture)
{
    auto* pDevice = TestingEnvironment::GetInstance()->GetDevice();

    TextureDesc Desc;
    Desc.Name      = "Test texture";
    Desc.Type      = RESOURCE_DIM_TEX_2D;
    Desc.Width     = 64;
    Desc.Height    = 32;
    Desc.Format    = TEX_FORMAT_RGBA8_UNORM;
    Desc.MipLevels = 3;
    Desc.BindFlags = BIND_SHADER_RESOURCE;

    RefCntAutoPtr<ITexture> pTexture;
    pDevice->CreateTexture(Desc, &pTexture);
    ASSERT_NE(pTexture, nullptr);
    EXPECT_EQ(pTexture->GetDesc(), Desc);

    RefCntAutoPtr<ITextureHost> pTextureHost{pTexture, IID_TextureHost};
    ASSERT_NE(pTextureHost, nullptr);
    EXPECT_EQ(pTextureHost->GetDataSize(), (64u * 32u + 32u * 16u + 16u * 8u) * 4u);
    EXPECT_EQ(pTextureHost->GetDataSize(), GetTextureDataSize(Desc));
}

TEST(RenderDeviceHostTest, CreateTexture_InvalidDesc)
{
    auto* pDevice = TestingEnvironment::GetInstance()->GetDevice();

    auto TestInvalidDesc = [pDevice](const char* Name, void (*Modify)(TextureDesc&)) {
        TextureDesc Desc;
        Desc.Name      = Name;
        Desc.Type      = RESOURCE_DIM_TEX_3D;
        Desc.Width     = 16;
        Desc.Height    = 16;
        Desc.Depth     = 16;
        Desc.Format    = TEX_FORMAT_R32_FLOAT;
        Desc.BindFlags = BIND_UNORDERED_ACCESS;
        Modify(Desc);

        TestingEnvironment::SetErrorAllowance(2);
        RefCntAutoPtr<ITexture> pTexture;
        pDevice->CreateTexture(Desc, &pTexture);
        EXPECT_EQ(pTexture, nullptr) << Name;
        TestingEnvironment::SetErrorAllowance(0);
    };

    std::cout << "\n\nNo worries, testing invalid texture descriptions...\n\n";

    TestInvalidDesc("Undefined type", [](TextureDesc& Desc) { Desc.Type = RESOURCE_DIM_BUFFER; });
    TestInvalidDesc("Zero width", [](TextureDesc& Desc) { Desc.Width = 0; });
    TestInvalidDesc("Unknown format", [](TextureDesc& Desc) { Desc.Format = TEX_FORMAT_UNKNOWN; });
    TestInvalidDesc("Mismatching render format", [](TextureDesc& Desc) { Desc.RenderFormat = RTF_ARGB_HALF; });
    TestInvalidDesc("Too many mips", [](TextureDesc& Desc) { Desc.MipLevels = 6; });
    TestInvalidDesc("Multisampled", [](TextureDesc& Desc) { Desc.SampleCount = 4; });
    TestInvalidDesc("Uniform buffer flag", [](TextureDesc& Desc) { Desc.BindFlags |= BIND_UNIFORM_BUFFER; });
    TestInvalidDesc("2D with depth", [](TextureDesc& Desc) { Desc.Type = RESOURCE_DIM_TEX_2D; });
}

TEST(RenderDeviceHostTest, CreateShaderProgram)
{
    auto* pDevice = TestingEnvironment::GetInstance()->GetDevice();

    RefCntAutoPtr<IShaderProgram> pProgram;
    {
        // The program keeps copies of the kernel names
        const String    Names[]       = {"Integrate", "Constrain", "Volume"};
        const Char*     KernelNames[] = {Names[0].c_str(), Names[1].c_str(), Names[2].c_str()};
        pDevice->CreateShaderProgram(ShaderProgramDesc{"Solver", KernelNames, 3}, &pProgram);
    }
    ASSERT_NE(pProgram, nullptr);
    EXPECT_EQ(pProgram->GetKernelCount(), 3u);
    EXPECT_EQ(pProgram->FindKernel("Integrate"), 0u);
    EXPECT_EQ(pProgram->FindKernel("Volume"), 2u);
    EXPECT_EQ(pProgram->FindKernel("Missing"), INVALID_KERNEL_INDEX);
    EXPECT_STREQ(pProgram->GetDesc().KernelNames[1], "Constrain");

    TestingEnvironment::SetErrorAllowance(1, "\n\nNo worries, testing out-of-range kernels...\n\n");
    RefCntAutoPtr<IBuffer> pBuffer;
    pProgram->SetBuffer(3, 0, pBuffer);
    TestingEnvironment::SetErrorAllowance(0);

    std::cout << "\n\nNo worries, testing invalid shader programs...\n\n";

    const Char* DuplicateNames[] = {"Main", "Main"};
    const Char* EmptyName[]      = {"Main", ""};

    TestingEnvironment::SetErrorAllowance(2);
    RefCntAutoPtr<IShaderProgram> pInvalid;
    pDevice->CreateShaderProgram(ShaderProgramDesc{"No kernels", DuplicateNames, 0}, &pInvalid);
    EXPECT_EQ(pInvalid, nullptr);

    TestingEnvironment::SetErrorAllowance(2);
    pDevice->CreateShaderProgram(ShaderProgramDesc{"Duplicate kernels", DuplicateNames, 2}, &pInvalid);
    EXPECT_EQ(pInvalid, nullptr);

    TestingEnvironment::SetErrorAllowance(2);
    pDevice->CreateShaderProgram(ShaderProgramDesc{"Empty kernel name", EmptyName, 2}, &pInvalid);
    EXPECT_EQ(pInvalid, nullptr);
    TestingEnvironment::SetErrorAllowance(0);
}

TEST(RenderDeviceHostTest, MemoryStats)
{
    EngineHostCreateInfo EngineCI;
    EngineCI.DeviceMemoryBudget = 1024;

    RefCntAutoPtr<IRenderDevice>               pDevice;
    std::vector<RefCntAutoPtr<IDeviceContext>> pContexts;
    TestingEnvironment::CreateDevice(EngineCI, pDevice, pContexts);
    ASSERT_NE(pDevice, nullptr);
    RefCntAutoPtr<IRenderDeviceHost> pDeviceHost{pDevice, IID_RenderDeviceHost};
    ASSERT_NE(pDeviceHost, nullptr);
    EXPECT_EQ(pDeviceHost->GetDeviceMemoryBudget(), 1024u);

    const auto& Stats = pDeviceHost->GetMemoryStats();
    EXPECT_EQ(Stats.AllocatedBytes, 0u);

    RefCntAutoPtr<IBuffer> pBuffer;
    pDevice->CreateBuffer(BufferDesc{"Buffer", 512, BIND_UNORDERED_ACCESS, BUFFER_MODE_STRUCTURED, COMPUTE_BUFFER_TYPE_DEFAULT, 16}, nullptr, &pBuffer);
    ASSERT_NE(pBuffer, nullptr);
    EXPECT_EQ(Stats.AllocatedBytes, 512u);
    EXPECT_EQ(Stats.NumBuffers, 1u);

    TextureDesc TexDesc;
    TexDesc.Name      = "Tracked texture";
    TexDesc.Type      = RESOURCE_DIM_TEX_2D;
    TexDesc.Width     = 8;
    TexDesc.Height    = 8;
    TexDesc.Format    = TEX_FORMAT_R32_FLOAT;
    TexDesc.BindFlags = BIND_SHADER_RESOURCE;

    RefCntAutoPtr<ITexture> pTexture;
    pDevice->CreateTexture(TexDesc, &pTexture);
    ASSERT_NE(pTexture, nullptr);
    EXPECT_EQ(Stats.AllocatedBytes, 512u + 256u);
    EXPECT_EQ(Stats.NumTextures, 1u);

    // 256 bytes are left
    TestingEnvironment::SetErrorAllowance(2, "\n\nNo worries, testing out-of-memory errors...\n\n");
    RefCntAutoPtr<IBuffer> pLargeBuffer;
    pDevice->CreateBuffer(BufferDesc{"Large buffer", 512, BIND_UNORDERED_ACCESS, BUFFER_MODE_STRUCTURED, COMPUTE_BUFFER_TYPE_DEFAULT, 16}, nullptr, &pLargeBuffer);
    EXPECT_EQ(pLargeBuffer, nullptr);
    TestingEnvironment::SetErrorAllowance(0);
    EXPECT_EQ(Stats.AllocatedBytes, 512u + 256u);
    EXPECT_EQ(Stats.NumBuffers, 1u);

    // Tracked resources are reclaimed, but stay alive
    pDeviceHost->ReleaseTrackedResources();
    EXPECT_FALSE(pTexture->IsValid());
    EXPECT_TRUE(pBuffer->IsValid());
    EXPECT_EQ(Stats.AllocatedBytes, 512u);
    EXPECT_EQ(Stats.NumTextures, 1u);

    pTexture.Release();
    EXPECT_EQ(Stats.NumTextures, 0u);
    EXPECT_EQ(Stats.AllocatedBytes, 512u);

    pDeviceHost->InvalidateResources();
    EXPECT_FALSE(pBuffer->IsValid());
    EXPECT_EQ(Stats.AllocatedBytes, 0u);

    pBuffer.Release();
    EXPECT_EQ(Stats.NumBuffers, 0u);
    EXPECT_EQ(Stats.NumBufferAllocations, 1u);
    EXPECT_EQ(Stats.NumTextureAllocations, 1u);
}

} // namespace
