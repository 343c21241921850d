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


#include <string>
#include <vector>

#include "ComputeResources.hpp"
#include "RenderDeviceHost.h"
#include "BufferBase.hpp"
#include "TextureBase.hpp"
#include "GraphicsAccessories.hpp"

#include "TestingEnvironment.hpp"

#include "gtest/gtest.h"

using namespace Bindery;
using namespace Bindery::Testing;

namespace
{

TEST(ComputeResourcesTest, BuildComputeBufferDesc)
{
    {
        const auto Desc = BuildComputeBufferDesc("Positions", 1024, 16);
        EXPECT_STREQ(Desc.Name, "Positions");
        EXPECT_EQ(Desc.Size, 1024u * 16u);
        EXPECT_EQ(Desc.ElementByteStride, 16u);
        EXPECT_EQ(Desc.ComputeType, COMPUTE_BUFFER_TYPE_DEFAULT);
        EXPECT_EQ(Desc.Mode, BUFFER_MODE_STRUCTURED);
        EXPECT_EQ(Desc.BindFlags, BIND_SHADER_RESOURCE | BIND_UNORDERED_ACCESS);
    }
    {
        const auto Desc = BuildComputeBufferDesc("Counters", 64, 4, COMPUTE_BUFFER_TYPE_RAW);
        EXPECT_EQ(Desc.Mode, BUFFER_MODE_RAW);
        EXPECT_EQ(Desc.BindFlags, BIND_SHADER_RESOURCE | BIND_UNORDERED_ACCESS);
    }
    {
        const auto Desc = BuildComputeBufferDesc("Constants", 1, 64, COMPUTE_BUFFER_TYPE_CONSTANT);
        EXPECT_EQ(Desc.BindFlags, BIND_UNIFORM_BUFFER);
    }
    {
        const auto Desc = BuildComputeBufferDesc("DispatchArgs", 3, 4, COMPUTE_BUFFER_TYPE_INDIRECT_ARGUMENTS);
        EXPECT_EQ(Desc.Mode, BUFFER_MODE_RAW);
        EXPECT_NE(Desc.BindFlags & BIND_INDIRECT_DRAW_ARGS, 0u);
    }

    // Every compute buffer type must produce a description the device accepts
    for (Uint32 Type = 0; Type < COMPUTE_BUFFER_TYPE_NUM_TYPES; ++Type)
    {
        EXPECT_NO_THROW(ValidateBufferDesc(BuildComputeBufferDesc("Test", 8, 16, static_cast<COMPUTE_BUFFER_TYPE>(Type))))
            << GetComputeBufferTypeString(static_cast<COMPUTE_BUFFER_TYPE>(Type));
    }
}

TEST(ComputeResourcesTest, BuildVolumeDesc)
{
    const auto Desc = BuildVolumeDesc("Density", 32, TEX_FORMAT_R32_FLOAT);
    EXPECT_STREQ(Desc.Name, "Density");
    EXPECT_EQ(Desc.Type, RESOURCE_DIM_TEX_3D);
    EXPECT_EQ(Desc.Width, 32u);
    EXPECT_EQ(Desc.Height, 32u);
    EXPECT_EQ(Desc.Depth, 32u);
    EXPECT_EQ(Desc.Format, TEX_FORMAT_R32_FLOAT);
    EXPECT_EQ(Desc.RenderFormat, RTF_R_FLOAT);
    EXPECT_EQ(Desc.SampleCount, 1u);
    EXPECT_EQ(Desc.MipLevels, 1u);
    EXPECT_NE(Desc.BindFlags & BIND_UNORDERED_ACCESS, 0u);
    EXPECT_EQ(Desc.AddressMode, TEXTURE_ADDRESS_CLAMP);
    EXPECT_EQ(Desc.Lifetime, RESOURCE_LIFETIME_EXPLICIT);

    const auto RTDesc = BuildVolumeDesc("Velocity", 16, RTF_ARGB_HALF);
    EXPECT_EQ(RTDesc.RenderFormat, RTF_ARGB_HALF);
    EXPECT_EQ(RTDesc.Format, TEX_FORMAT_RGBA16_FLOAT);
    EXPECT_EQ(RTDesc.Depth, 16u);
}

TEST(ComputeResourcesTest, IsReusable)
{
    auto* pDevice = TestingEnvironment::GetInstance()->GetDevice();

    EXPECT_FALSE(IsBufferReusable(nullptr, 16, 4));
    EXPECT_FALSE(IsVolumeReusable(static_cast<const ITexture*>(nullptr), 8, RTF_R_FLOAT));
    EXPECT_FALSE(IsVolumeReusable(static_cast<const ITexture*>(nullptr), 8, TEX_FORMAT_R32_FLOAT));

    RefCntAutoPtr<IBuffer> pBuffer;
    pDevice->CreateBuffer(BuildComputeBufferDesc("Buffer", 16, 8), nullptr, &pBuffer);
    ASSERT_NE(pBuffer, nullptr);
    EXPECT_TRUE(IsBufferReusable(pBuffer, 16, 8));
    EXPECT_FALSE(IsBufferReusable(pBuffer, 32, 8));
    EXPECT_FALSE(IsBufferReusable(pBuffer, 16, 4));
    // Same size, different shape
    EXPECT_FALSE(IsBufferReusable(pBuffer, 32, 4));

    RefCntAutoPtr<ITexture> pVolume;
    pDevice->CreateTexture(BuildVolumeDesc("Volume", 8, RTF_ARGB_HALF), &pVolume);
    ASSERT_NE(pVolume, nullptr);
    EXPECT_TRUE(IsVolumeReusable(pVolume, 8, RTF_ARGB_HALF));
    EXPECT_TRUE(IsVolumeReusable(pVolume, 8, TEX_FORMAT_RGBA16_FLOAT));
    EXPECT_FALSE(IsVolumeReusable(pVolume, 4, RTF_ARGB_HALF));
    EXPECT_FALSE(IsVolumeReusable(pVolume, 8, RTF_ARGB_FLOAT));
    EXPECT_FALSE(IsVolumeReusable(pVolume, 8, TEX_FORMAT_RGBA16_UNORM));
}

TEST(ComputeResourcesTest, BufferLifecycle)
{
    ComputeResourceManager ResMgr{TestingEnvironment::GetInstance()->GetDevice()};

    RefCntAutoPtr<IBuffer> pPositions;
    EXPECT_TRUE(ResMgr.CreateBuffer(pPositions, "Positions", 1024, 16));
    ASSERT_NE(pPositions, nullptr);
    EXPECT_STREQ(pPositions->GetDesc().Name, "Positions");
    EXPECT_EQ(GetBufferElementCount(pPositions->GetDesc()), 1024u);
    EXPECT_EQ(pPositions->GetDesc().ElementByteStride, 16u);
    const auto FirstID = pPositions->GetUniqueID();

    // Same shape: the buffer is kept
    EXPECT_FALSE(ResMgr.CreateBuffer(pPositions, "Positions", 1024, 16));
    ASSERT_NE(pPositions, nullptr);
    EXPECT_EQ(pPositions->GetUniqueID(), FirstID);

    // Different count
    EXPECT_TRUE(ResMgr.CreateBuffer(pPositions, "Positions", 2048, 16));
    ASSERT_NE(pPositions, nullptr);
    EXPECT_EQ(GetBufferElementCount(pPositions->GetDesc()), 2048u);
    EXPECT_NE(pPositions->GetUniqueID(), FirstID);
    const auto SecondID = pPositions->GetUniqueID();

    // Different stride
    EXPECT_TRUE(ResMgr.CreateBuffer(pPositions, "Positions", 2048, 32));
    ASSERT_NE(pPositions, nullptr);
    EXPECT_EQ(pPositions->GetDesc().ElementByteStride, 32u);
    EXPECT_NE(pPositions->GetUniqueID(), SecondID);

    ResMgr.ReleaseBuffer(pPositions);
    EXPECT_EQ(pPositions, nullptr);
    ResMgr.ReleaseBuffer(pPositions);
    EXPECT_EQ(pPositions, nullptr);

    // A released slot is always recreated
    EXPECT_TRUE(ResMgr.CreateBuffer(pPositions, "Positions", 2048, 32));
    EXPECT_NE(pPositions, nullptr);
    ResMgr.ReleaseBuffer(pPositions);
}

TEST(ComputeResourcesTest, BufferTypeIsNotCompared)
{
    ComputeResourceManager ResMgr{TestingEnvironment::GetInstance()->GetDevice()};

    RefCntAutoPtr<IBuffer> pBuffer;
    EXPECT_TRUE(ResMgr.CreateBuffer(pBuffer, "Buffer", 64, 4, COMPUTE_BUFFER_TYPE_STRUCTURED));
    EXPECT_FALSE(ResMgr.CreateBuffer(pBuffer, "Renamed", 64, 4, COMPUTE_BUFFER_TYPE_APPEND));
    ASSERT_NE(pBuffer, nullptr);
    EXPECT_STREQ(pBuffer->GetDesc().Name, "Buffer");
    EXPECT_EQ(pBuffer->GetDesc().ComputeType, COMPUTE_BUFFER_TYPE_STRUCTURED);
}

TEST(ComputeResourcesTest, VolumeLifecycle)
{
    ComputeResourceManager ResMgr{TestingEnvironment::GetInstance()->GetDevice()};

    RefCntAutoPtr<ITexture> pVolume;
    EXPECT_TRUE(ResMgr.CreateVolume(pVolume, "Density", 32, RTF_R_FLOAT));
    ASSERT_NE(pVolume, nullptr);
    {
        const auto& Desc = pVolume->GetDesc();
        EXPECT_STREQ(Desc.Name, "Density");
        EXPECT_EQ(Desc.Type, RESOURCE_DIM_TEX_3D);
        EXPECT_EQ(Desc.Width, 32u);
        EXPECT_EQ(Desc.Height, 32u);
        EXPECT_EQ(Desc.Depth, 32u);
        EXPECT_EQ(Desc.RenderFormat, RTF_R_FLOAT);
        EXPECT_EQ(Desc.Lifetime, RESOURCE_LIFETIME_EXPLICIT);
    }
    const auto FirstID = pVolume->GetUniqueID();

    EXPECT_FALSE(ResMgr.CreateVolume(pVolume, "Density", 32, RTF_R_FLOAT));
    EXPECT_EQ(pVolume->GetUniqueID(), FirstID);

    // Cells changed
    EXPECT_TRUE(ResMgr.CreateVolume(pVolume, "Density", 64, RTF_R_FLOAT));
    EXPECT_EQ(pVolume->GetDesc().Depth, 64u);

    // Format changed
    EXPECT_TRUE(ResMgr.CreateVolume(pVolume, "Density", 64, RTF_R_HALF));
    EXPECT_EQ(pVolume->GetDesc().RenderFormat, RTF_R_HALF);

    ResMgr.ReleaseVolume(pVolume);
    EXPECT_EQ(pVolume, nullptr);
    ResMgr.ReleaseVolume(pVolume);
    EXPECT_EQ(pVolume, nullptr);

    EXPECT_TRUE(ResMgr.CreateVolume(pVolume, "Density", 64, RTF_R_HALF));
    EXPECT_NE(pVolume, nullptr);
}

TEST(ComputeResourcesTest, VolumeLifecycle_TextureFormat)
{
    ComputeResourceManager ResMgr{TestingEnvironment::GetInstance()->GetDevice()};

    RefCntAutoPtr<ITexture> pVolume;
    EXPECT_TRUE(ResMgr.CreateVolume(pVolume, "Impulse", 16, TEX_FORMAT_RGBA16_FLOAT));
    ASSERT_NE(pVolume, nullptr);
    EXPECT_EQ(pVolume->GetDesc().Format, TEX_FORMAT_RGBA16_FLOAT);
    const auto FirstID = pVolume->GetUniqueID();

    EXPECT_FALSE(ResMgr.CreateVolume(pVolume, "Impulse", 16, TEX_FORMAT_RGBA16_FLOAT));
    EXPECT_EQ(pVolume->GetUniqueID(), FirstID);

    // Both formats describe 4 x 16-bit channels, but the layouts differ
    EXPECT_TRUE(ResMgr.CreateVolume(pVolume, "Impulse", 16, TEX_FORMAT_RGBA16_UNORM));
    EXPECT_EQ(pVolume->GetDesc().Format, TEX_FORMAT_RGBA16_UNORM);

    // Formats without a render texture format counterpart are supported
    EXPECT_TRUE(ResMgr.CreateVolume(pVolume, "Impulse", 16, TEX_FORMAT_R8_UINT));
    EXPECT_EQ(pVolume->GetDesc().RenderFormat, RTF_UNDEFINED);

    ResMgr.ReleaseVolume(pVolume);
}

TEST(ComputeResourcesTest, RecreateInvalidResources)
{
    RefCntAutoPtr<IRenderDevice>               pDevice;
    std::vector<RefCntAutoPtr<IDeviceContext>> pContexts;
    TestingEnvironment::CreateDevice(EngineHostCreateInfo{}, pDevice, pContexts);
    ASSERT_NE(pDevice, nullptr);
    RefCntAutoPtr<IRenderDeviceHost> pDeviceHost{pDevice, IID_RenderDeviceHost};
    ASSERT_NE(pDeviceHost, nullptr);

    ComputeResourceManager ResMgr{pDevice};

    RefCntAutoPtr<IBuffer>  pBuffer;
    RefCntAutoPtr<ITexture> pVolume;
    EXPECT_TRUE(ResMgr.CreateBuffer(pBuffer, "Buffer", 256, 4));
    EXPECT_TRUE(ResMgr.CreateVolume(pVolume, "Volume", 8, RTF_R_FLOAT));

    // Explicit-lifetime volumes survive the reclamation of tracked resources
    pDeviceHost->ReleaseTrackedResources();
    EXPECT_TRUE(pVolume->IsValid());
    EXPECT_FALSE(ResMgr.CreateVolume(pVolume, "Volume", 8, RTF_R_FLOAT));

    pDeviceHost->InvalidateResources();
    EXPECT_FALSE(pBuffer->IsValid());
    EXPECT_FALSE(pVolume->IsValid());

    EXPECT_TRUE(ResMgr.CreateBuffer(pBuffer, "Buffer", 256, 4));
    EXPECT_TRUE(pBuffer->IsValid());
    EXPECT_TRUE(ResMgr.CreateVolume(pVolume, "Volume", 8, RTF_R_FLOAT));
    EXPECT_TRUE(pVolume->IsValid());

    EXPECT_EQ(pDeviceHost->GetMemoryStats().NumBuffers, 1u);
    EXPECT_EQ(pDeviceHost->GetMemoryStats().NumTextures, 1u);
    EXPECT_EQ(pDeviceHost->GetMemoryStats().NumBufferAllocations, 2u);
    EXPECT_EQ(pDeviceHost->GetMemoryStats().NumTextureAllocations, 2u);
}

TEST(ComputeResourcesTest, AllocationFailure)
{
    EngineHostCreateInfo EngineCI;
    EngineCI.DeviceMemoryBudget = 4096;

    RefCntAutoPtr<IRenderDevice>               pDevice;
    std::vector<RefCntAutoPtr<IDeviceContext>> pContexts;
    TestingEnvironment::CreateDevice(EngineCI, pDevice, pContexts);
    ASSERT_NE(pDevice, nullptr);
    RefCntAutoPtr<IRenderDeviceHost> pDeviceHost{pDevice, IID_RenderDeviceHost};

    ComputeResourceManager ResMgr{pDevice};

    RefCntAutoPtr<IBuffer> pBuffer;
    EXPECT_TRUE(ResMgr.CreateBuffer(pBuffer, "Buffer", 256, 16));
    EXPECT_EQ(pDeviceHost->GetMemoryStats().AllocatedBytes, 4096u);

    // The device, the device object factory and the manager each report the failure
    TestingEnvironment::SetErrorAllowance(3, "\n\nNo worries, testing out-of-memory errors...\n\n");
    EXPECT_THROW(ResMgr.CreateBuffer(pBuffer, "Buffer", 512, 16), std::runtime_error);
    EXPECT_EQ(pBuffer, nullptr);
    EXPECT_EQ(pDeviceHost->GetMemoryStats().AllocatedBytes, 0u);

    TestingEnvironment::SetErrorAllowance(3, "\n\nNo worries, testing invalid buffer shapes...\n\n");
    EXPECT_THROW(ResMgr.CreateBuffer(pBuffer, "Buffer", 16, 3), std::runtime_error);
    EXPECT_EQ(pBuffer, nullptr);

    RefCntAutoPtr<ITexture> pVolume;
    TestingEnvironment::SetErrorAllowance(3, "\n\nNo worries, testing empty volumes...\n\n");
    EXPECT_THROW(ResMgr.CreateVolume(pVolume, "Volume", 0, RTF_R_FLOAT), std::runtime_error);
    EXPECT_EQ(pVolume, nullptr);

    TestingEnvironment::SetErrorAllowance(0);

    // The failed slot is usable again once the request fits
    EXPECT_TRUE(ResMgr.CreateBuffer(pBuffer, "Buffer", 128, 16));
    EXPECT_NE(pBuffer, nullptr);
}

TEST(ComputeResourcesTest, OversizedResources)
{
    EngineHostCreateInfo EngineCI;
    EngineCI.DeviceMemoryBudget = 4096;

    RefCntAutoPtr<IRenderDevice>               pDevice;
    std::vector<RefCntAutoPtr<IDeviceContext>> pContexts;
    TestingEnvironment::CreateDevice(EngineCI, pDevice, pContexts);
    ASSERT_NE(pDevice, nullptr);
    RefCntAutoPtr<IRenderDeviceHost> pDeviceHost{pDevice, IID_RenderDeviceHost};

    ComputeResourceManager ResMgr{pDevice};

    RefCntAutoPtr<IBuffer> pBuffer;
    EXPECT_TRUE(ResMgr.CreateBuffer(pBuffer, "Buffer", 16, 16));
    EXPECT_EQ(pDeviceHost->GetMemoryStats().AllocatedBytes, 256u);

    // The byte size fits into 64 bits but not into a host allocation
    TestingEnvironment::SetErrorAllowance(3, "\n\nNo worries, testing oversized buffers...\n\n");
    EXPECT_THROW(ResMgr.CreateBuffer(pBuffer, "Huge", 0xFFFFFFFFu, 0xFFFFFFFCu), std::runtime_error);
    EXPECT_EQ(pBuffer, nullptr);
    EXPECT_EQ(pDeviceHost->GetMemoryStats().AllocatedBytes, 0u);

    RefCntAutoPtr<ITexture> pVolume;
    TestingEnvironment::SetErrorAllowance(3, "\n\nNo worries, testing oversized volumes...\n\n");
    EXPECT_THROW(ResMgr.CreateVolume(pVolume, "Huge", 1u << 22, TEX_FORMAT_RGBA32_FLOAT), std::runtime_error);
    EXPECT_EQ(pVolume, nullptr);

    TestingEnvironment::SetErrorAllowance(3, "\n\nNo worries, testing oversized volumes...\n\n");
    EXPECT_THROW(ResMgr.CreateVolume(pVolume, "Huge", MAX_TEXTURE_3D_DIMENSION + 1, RTF_R_FLOAT), std::runtime_error);
    EXPECT_EQ(pVolume, nullptr);
    EXPECT_EQ(pDeviceHost->GetMemoryStats().AllocatedBytes, 0u);

    TextureDesc Tex2DDesc;
    Tex2DDesc.Name   = "Huge2D";
    Tex2DDesc.Type   = RESOURCE_DIM_TEX_2D;
    Tex2DDesc.Width  = MAX_TEXTURE_2D_DIMENSION + 1;
    Tex2DDesc.Height = 1;
    Tex2DDesc.Depth  = 1;
    Tex2DDesc.Format = TEX_FORMAT_R32_FLOAT;
    TestingEnvironment::SetErrorAllowance(1, "\n\nNo worries, testing oversized 2D textures...\n\n");
    EXPECT_THROW(ValidateTextureDesc(Tex2DDesc), std::runtime_error);

    TestingEnvironment::SetErrorAllowance(0);

    EXPECT_TRUE(ResMgr.CreateBuffer(pBuffer, "Buffer", 16, 16));
    EXPECT_NE(pBuffer, nullptr);
    EXPECT_TRUE(ResMgr.CreateVolume(pVolume, "Volume", 4, RTF_R_FLOAT));
    EXPECT_NE(pVolume, nullptr);
    EXPECT_EQ(pDeviceHost->GetMemoryStats().AllocatedBytes, 256u + 4u * 4u * 4u * 4u);
}

std::vector<String> g_InfoMessages;

void CaptureInfoMessages(DEBUG_MESSAGE_SEVERITY Severity,
                         const Char*            Message,
                         const Char*            Function,
                         const Char*            File,
                         int                    Line)
{
    if (Severity == DEBUG_MESSAGE_SEVERITY_INFO)
        g_InfoMessages.emplace_back(Message != nullptr ? Message : "");
    else
        TestingEnvironment::MessageCallback(Severity, Message, Function, File, Line);
}

TEST(ComputeResourcesTest, UnnamedResources)
{
    auto* pDevice = TestingEnvironment::GetInstance()->GetDevice();

    ComputeResourceManager ResMgr{pDevice};

    g_InfoMessages.clear();
    SetDebugMessageCallback(CaptureInfoMessages);

    RefCntAutoPtr<IBuffer>  pBuffer;
    RefCntAutoPtr<ITexture> pVolume;
    const bool              BufferCreated = ResMgr.CreateBuffer(pBuffer, nullptr, 4, 16);
    const bool              VolumeCreated = ResMgr.CreateVolume(pVolume, nullptr, 2, RTF_R_FLOAT);

    SetDebugMessageCallback(TestingEnvironment::MessageCallback);

    EXPECT_TRUE(BufferCreated);
    EXPECT_TRUE(VolumeCreated);
    EXPECT_NE(pBuffer, nullptr);
    EXPECT_NE(pVolume, nullptr);

    ASSERT_EQ(g_InfoMessages.size(), 2u);
    EXPECT_NE(g_InfoMessages[0].find("Creating buffer ''"), String::npos) << g_InfoMessages[0];
    EXPECT_NE(g_InfoMessages[0].find("4 x 16 bytes"), String::npos) << g_InfoMessages[0];
    EXPECT_NE(g_InfoMessages[1].find("Creating volume ''"), String::npos) << g_InfoMessages[1];
    g_InfoMessages.clear();
}

} // namespace

